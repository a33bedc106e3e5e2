// uast_bridge/bridge/boundary.cpp - Critical section implementation
#include "uast_bridge/bridge/boundary.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "uast_bridge/bridge/errors.hpp"
#include "uast_bridge/bridge/node_access.hpp"
#include "uast_bridge/engine/uast_engine.h"

namespace uast_bridge
{

namespace
{

std::mutex g_evaluation_mutex;
std::mutex g_iteration_mutex;
std::once_flag g_engine_init;

thread_local BoundaryScope * t_current_scope = nullptr;

std::unique_lock<std::mutex> acquire(BoundaryKind kind)
{
  if (BoundaryScope::is_open(kind)) {
    throw BridgeError(
      "reentrant " + std::string(to_string(kind)) + " boundary call on the same thread");
  }
  ensure_engine_initialized();
  return std::unique_lock<std::mutex>(boundary_mutex(kind));
}

}  // namespace

std::string_view to_string(BoundaryKind kind) noexcept
{
  switch (kind) {
    case BoundaryKind::Evaluation:
      return "evaluation";
    case BoundaryKind::Iteration:
      return "iteration";
  }
  return "unknown";
}

std::mutex & boundary_mutex(BoundaryKind kind) noexcept
{
  return kind == BoundaryKind::Evaluation ? g_evaluation_mutex : g_iteration_mutex;
}

void ensure_engine_initialized()
{
  std::call_once(g_engine_init, [] { UastEngineInit(&node_access::node_iface()); });
}

BoundaryScope::BoundaryScope(BoundaryKind kind, NodePtr root)
: kind_(kind), lock_(acquire(kind)), pin_(std::move(root))
{
  previous_ = t_current_scope;
  t_current_scope = this;
}

BoundaryScope::~BoundaryScope() { t_current_scope = previous_; }

const BoundaryScope::PropertyOrder & BoundaryScope::sorted_properties(const Node & node)
{
  auto it = property_order_.find(&node);
  if (it != property_order_.end()) {
    return it->second;
  }

  PropertyOrder order;
  order.reserve(node.properties.size());
  for (const auto & prop : node.properties) {
    order.push_back(&prop);
  }
  std::sort(order.begin(), order.end(), [](const Property * a, const Property * b) {
    return a->first < b->first;
  });
  return property_order_.emplace(&node, std::move(order)).first->second;
}

BoundaryScope * BoundaryScope::current() noexcept { return t_current_scope; }

bool BoundaryScope::is_open(BoundaryKind kind) noexcept
{
  for (const BoundaryScope * s = t_current_scope; s != nullptr; s = s->enclosing()) {
    if (s->kind() == kind) return true;
  }
  return false;
}

}  // namespace uast_bridge
