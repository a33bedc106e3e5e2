// uast_bridge/bridge/filter.cpp - XPath query evaluation implementation
#include "uast_bridge/bridge/filter.hpp"

#include <string>
#include <utility>

#include "uast_bridge/bridge/boundary.hpp"
#include "uast_bridge/bridge/engine_error.hpp"
#include "uast_bridge/bridge/errors.hpp"
#include "uast_bridge/engine/uast_engine.h"

namespace uast_bridge
{

std::vector<NodePtr> filter(const NodePtr & root, std::string_view query)
{
  if (query.empty()) {
    return {};
  }
  if (!root) {
    throw QueryError("filter() failed: null root node");
  }
  if (query.find('\0') != std::string_view::npos) {
    throw QueryError("filter() failed: query contains a NUL byte");
  }

  BoundaryScope scope(BoundaryKind::Evaluation, root);
  const ExternalString cquery = scope.arena().export_string(query);

  const bool ok = UastEngineFilter(scope.pin().root_handle(), cquery);
  if (scope.out_of_memory()) {
    throw QueryError("filter() failed: out of memory");
  }
  if (!ok) {
    throw QueryError("filter() failed: " + take_engine_error("unknown engine error"));
  }

  const int count = UastEngineResultSize();
  std::vector<NodePtr> results;
  results.reserve(count > 0 ? static_cast<size_t>(count) : 0U);
  for (int i = 0; i < count; ++i) {
    NodePtr node = scope.pin().alias(UastEngineResultAt(i));
    if (node) results.push_back(std::move(node));
  }
  return results;
}

}  // namespace uast_bridge
