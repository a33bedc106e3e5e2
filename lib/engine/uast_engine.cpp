// uast_bridge/engine/uast_engine.cpp - C interface of the UAST query engine
//
// Global state lives in a single EngineState instance. None of it is
// synchronized; the host serializes access. The last error is kept per
// thread (like errno) because filters and traversals may run concurrently.
//
#include "uast_bridge/engine/uast_engine.h"

#include <libxml/parser.h>

#include <cstdlib>
#include <cstring>
#include <new>
#include <string>
#include <vector>

#include "uast_bridge/engine/tree_cursor.hpp"
#include "uast_bridge/engine/xml_ll.hpp"
#include "uast_bridge/engine/xpath_projection.hpp"

struct UastIterator
{
  uast_bridge::engine::TreeCursor cursor;
};

namespace uast_bridge::engine
{
namespace
{

struct EngineState
{
  UastNodeIface iface{};
  bool initialized = false;
  RoleNames role_names;
  std::vector<uintptr_t> results;
};

EngineState & state()
{
  static EngineState s;
  return s;
}

std::string & last_error()
{
  thread_local std::string error;
  return error;
}

void set_error(std::string message) { last_error() = std::move(message); }

bool require_initialized()
{
  if (state().initialized) return true;
  set_error("engine not initialized");
  return false;
}

bool run_filter(uintptr_t node, const char * query)
{
  EngineState & s = state();
  s.results.clear();
  last_error().clear();

  if (!require_initialized()) return false;
  if (node == 0) {
    set_error("invalid root node");
    return false;
  }
  if (query == nullptr) {
    set_error("null query");
    return false;
  }

  const xml_ll::Document doc = project_tree(s.iface, s.role_names, node);
  if (doc.is_null()) {
    set_error("failed to build XML projection of the tree");
    return false;
  }

  xml_ll::XPathContext ctx(doc);
  const xml_ll::XPathObject result = ctx.evaluate(query);
  if (result.is_null()) {
    set_error(ctx.error().empty() ? std::string("invalid XPath expression") : ctx.error());
    return false;
  }
  if (!ctx.error().empty()) {
    set_error(ctx.error());
    return false;
  }
  if (!result.is_node_set()) {
    set_error("query does not evaluate to a node set");
    return false;
  }

  for (xmlNodePtr n : result.nodes()) {
    const uintptr_t handle = handle_of(n);
    if (handle != 0) s.results.push_back(handle);
  }
  return true;
}

}  // namespace
}  // namespace uast_bridge::engine

using uast_bridge::engine::last_error;
using uast_bridge::engine::set_error;
using uast_bridge::engine::state;

extern "C" {

void UastEngineInit(const UastNodeIface * iface)
{
  xmlInitParser();
  auto & s = state();
  if (iface == nullptr) {
    s.iface = UastNodeIface{};
    s.initialized = false;
    return;
  }
  s.iface = *iface;
  s.initialized = true;
}

void UastEngineRegisterRole(uint16_t role, const char * name)
{
  auto & names = state().role_names;
  if (name == nullptr || *name == '\0') {
    names.erase(role);
    return;
  }
  names[role] = name;
}

bool UastEngineFilter(uintptr_t node, const char * query)
{
  try {
    return uast_bridge::engine::run_filter(node, query);
  } catch (const std::bad_alloc &) {
    state().results.clear();
    set_error("out of memory");
    return false;
  }
}

int UastEngineResultSize(void) { return static_cast<int>(state().results.size()); }

uintptr_t UastEngineResultAt(int index)
{
  const auto & results = state().results;
  if (index < 0 || static_cast<size_t>(index) >= results.size()) return 0;
  return results[static_cast<size_t>(index)];
}

char * UastEngineLastError(void)
{
  const std::string & err = last_error();
  if (err.empty()) return nullptr;

  auto * copy = static_cast<char *>(std::malloc(err.size() + 1));
  if (copy == nullptr) return nullptr;
  std::memcpy(copy, err.c_str(), err.size() + 1);
  return copy;
}

UastIterator * UastEngineIteratorNew(uintptr_t node, int order)
{
  using uast_bridge::engine::CursorOrder;
  using uast_bridge::engine::TreeCursor;

  last_error().clear();
  if (!uast_bridge::engine::require_initialized()) return nullptr;
  if (node == 0) {
    set_error("invalid root node");
    return nullptr;
  }
  if (!uast_bridge::engine::is_valid_cursor_order(order)) {
    set_error("unknown tree order " + std::to_string(order));
    return nullptr;
  }

  try {
    return new UastIterator{TreeCursor(state().iface, node, static_cast<CursorOrder>(order))};
  } catch (const std::bad_alloc &) {
    set_error("out of memory");
    return nullptr;
  }
}

uintptr_t UastEngineIteratorNext(UastIterator * iter)
{
  last_error().clear();
  if (iter == nullptr) return 0;
  try {
    return iter->cursor.next();
  } catch (const std::bad_alloc &) {
    set_error("out of memory");
    return 0;
  }
}

void UastEngineIteratorFree(UastIterator * iter) { delete iter; }

}  // extern "C"
