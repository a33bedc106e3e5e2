// uast_bridge/bridge/node_access.cpp - Node callbacks implementation
#include "uast_bridge/bridge/node_access.hpp"

#include <new>
#include <string_view>

#include "uast_bridge/bridge/boundary.hpp"

namespace uast_bridge::node_access
{

namespace
{

// Allocation failures cannot cross the C boundary. They are recorded on the
// scope, the callback answers "" or nullptr, and the caller throws after the
// engine returns.
ExternalString export_text(std::string_view text) noexcept
{
  BoundaryScope * scope = BoundaryScope::current();
  if (scope == nullptr) return "";
  try {
    return scope->arena().export_string(text);
  } catch (const std::bad_alloc &) {
    scope->set_out_of_memory();
    return "";
  }
}

bool in_range(int index, size_t size) noexcept
{
  return index >= 0 && static_cast<size_t>(index) < size;
}

const Property * property_at(const Node & node, int index) noexcept
{
  BoundaryScope * scope = BoundaryScope::current();
  if (scope == nullptr) return nullptr;
  try {
    const auto & order = scope->sorted_properties(node);
    return in_range(index, order.size()) ? order[static_cast<size_t>(index)] : nullptr;
  } catch (const std::bad_alloc &) {
    scope->set_out_of_memory();
    return nullptr;
  }
}

// Position accessors share one shape per side and field.
const std::optional<Position> * start_of(Handle h) noexcept
{
  const Node * n = from_handle(h);
  return n ? &n->start_position : nullptr;
}

const std::optional<Position> * end_of(Handle h) noexcept
{
  const Node * n = from_handle(h);
  return n ? &n->end_position : nullptr;
}

bool has(const std::optional<Position> * p) noexcept { return p != nullptr && p->has_value(); }

uint32_t field(const std::optional<Position> * p, uint32_t Position::*member) noexcept
{
  return has(p) ? (**p).*member : 0U;
}

}  // namespace

const UastNodeIface & node_iface() noexcept
{
  static const UastNodeIface iface = [] {
    UastNodeIface t{};
    t.internal_type = &get_internal_type;
    t.token = &get_token;
    t.children_size = &get_children_count;
    t.child_at = &get_child_at;
    t.roles_size = &get_roles_count;
    t.role_at = &get_role_at;
    t.properties_size = &get_properties_count;
    t.property_key_at = &get_property_key_at;
    t.property_value_at = &get_property_value_at;
    t.has_start_offset = &has_start_offset;
    t.start_offset = &get_start_offset;
    t.has_start_line = &has_start_line;
    t.start_line = &get_start_line;
    t.has_start_col = &has_start_col;
    t.start_col = &get_start_col;
    t.has_end_offset = &has_end_offset;
    t.end_offset = &get_end_offset;
    t.has_end_line = &has_end_line;
    t.end_line = &get_end_line;
    t.has_end_col = &has_end_col;
    t.end_col = &get_end_col;
    return t;
  }();
  return iface;
}

// ============================================================================
// Type and token
// ============================================================================

ExternalString get_internal_type(Handle node) noexcept
{
  const Node * n = from_handle(node);
  return export_text(n ? std::string_view(n->internal_type) : std::string_view());
}

ExternalString get_token(Handle node) noexcept
{
  const Node * n = from_handle(node);
  return export_text(n ? std::string_view(n->token) : std::string_view());
}

// ============================================================================
// Children and roles
// ============================================================================

int get_children_count(Handle node) noexcept
{
  const Node * n = from_handle(node);
  return n ? static_cast<int>(n->children.size()) : 0;
}

Handle get_child_at(Handle node, int index) noexcept
{
  const Node * n = from_handle(node);
  if (n == nullptr || !in_range(index, n->children.size())) return k_null_handle;
  return to_handle(n->children[static_cast<size_t>(index)].get());
}

int get_roles_count(Handle node) noexcept
{
  const Node * n = from_handle(node);
  return n ? static_cast<int>(n->roles.size()) : 0;
}

uint16_t get_role_at(Handle node, int index) noexcept
{
  const Node * n = from_handle(node);
  if (n == nullptr || !in_range(index, n->roles.size())) return 0;
  return n->roles[static_cast<size_t>(index)];
}

// ============================================================================
// Properties
// ============================================================================

int get_properties_count(Handle node) noexcept
{
  const Node * n = from_handle(node);
  return n ? static_cast<int>(n->properties.size()) : 0;
}

ExternalString get_property_key_at(Handle node, int index) noexcept
{
  const Node * n = from_handle(node);
  const Property * p = n ? property_at(*n, index) : nullptr;
  return export_text(p ? std::string_view(p->first) : std::string_view());
}

ExternalString get_property_value_at(Handle node, int index) noexcept
{
  const Node * n = from_handle(node);
  const Property * p = n ? property_at(*n, index) : nullptr;
  return export_text(p ? std::string_view(p->second) : std::string_view());
}

// ============================================================================
// Positions
// ============================================================================

bool has_start_offset(Handle node) noexcept { return has(start_of(node)); }
uint32_t get_start_offset(Handle node) noexcept { return field(start_of(node), &Position::offset); }
bool has_start_line(Handle node) noexcept { return has(start_of(node)); }
uint32_t get_start_line(Handle node) noexcept { return field(start_of(node), &Position::line); }
bool has_start_col(Handle node) noexcept { return has(start_of(node)); }
uint32_t get_start_col(Handle node) noexcept { return field(start_of(node), &Position::col); }

bool has_end_offset(Handle node) noexcept { return has(end_of(node)); }
uint32_t get_end_offset(Handle node) noexcept { return field(end_of(node), &Position::offset); }
bool has_end_line(Handle node) noexcept { return has(end_of(node)); }
uint32_t get_end_line(Handle node) noexcept { return field(end_of(node), &Position::line); }
bool has_end_col(Handle node) noexcept { return has(end_of(node)); }
uint32_t get_end_col(Handle node) noexcept { return field(end_of(node), &Position::col); }

}  // namespace uast_bridge::node_access
