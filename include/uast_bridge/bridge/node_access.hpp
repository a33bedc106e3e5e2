// uast_bridge/bridge/node_access.hpp - Node callbacks invoked by the engine
//
// One function per node field, each taking a handle. They are the entries of
// the UastNodeIface table installed in the engine and must only run inside a
// BoundaryScope: strings are exported into the current scope's arena and
// property order comes from the scope's cache. Outside a scope, string
// accessors return an empty string.
//
// Out-of-range indices yield a null handle, 0 or an empty string. If a string
// cannot be allocated the callback returns "" and marks the scope out of
// memory.
//
#pragma once

#include <cstdint>

#include "uast_bridge/bridge/handle.hpp"
#include "uast_bridge/bridge/string_arena.hpp"
#include "uast_bridge/engine/uast_engine.h"

namespace uast_bridge::node_access
{

/// Callback table handed to UastEngineInit.
[[nodiscard]] const UastNodeIface & node_iface() noexcept;

// Type and token
[[nodiscard]] ExternalString get_internal_type(Handle node) noexcept;
[[nodiscard]] ExternalString get_token(Handle node) noexcept;

// Children
[[nodiscard]] int get_children_count(Handle node) noexcept;
[[nodiscard]] Handle get_child_at(Handle node, int index) noexcept;

// Roles
[[nodiscard]] int get_roles_count(Handle node) noexcept;
[[nodiscard]] uint16_t get_role_at(Handle node, int index) noexcept;

// Properties, in key order
[[nodiscard]] int get_properties_count(Handle node) noexcept;
[[nodiscard]] ExternalString get_property_key_at(Handle node, int index) noexcept;
[[nodiscard]] ExternalString get_property_value_at(Handle node, int index) noexcept;

// Start position. "has" reports whether the record exists at all; the getters
// return 0 when it does not.
[[nodiscard]] bool has_start_offset(Handle node) noexcept;
[[nodiscard]] uint32_t get_start_offset(Handle node) noexcept;
[[nodiscard]] bool has_start_line(Handle node) noexcept;
[[nodiscard]] uint32_t get_start_line(Handle node) noexcept;
[[nodiscard]] bool has_start_col(Handle node) noexcept;
[[nodiscard]] uint32_t get_start_col(Handle node) noexcept;

// End position
[[nodiscard]] bool has_end_offset(Handle node) noexcept;
[[nodiscard]] uint32_t get_end_offset(Handle node) noexcept;
[[nodiscard]] bool has_end_line(Handle node) noexcept;
[[nodiscard]] uint32_t get_end_line(Handle node) noexcept;
[[nodiscard]] bool has_end_col(Handle node) noexcept;
[[nodiscard]] uint32_t get_end_col(Handle node) noexcept;

}  // namespace uast_bridge::node_access
