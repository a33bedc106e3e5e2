// uast_bridge/engine/xpath_projection.hpp - XML projection of a host tree
//
// Builds a libxml2 document mirroring the tree reachable from a node handle.
// Every element keeps the handle of the node it was built from in _private,
// so XPath results map back to host nodes without copying them.
//
// Projection rules:
//   element name        internal type ("_" when empty)
//   @token              token, when non-empty
//   @role<Name>         one per role; Name from the role registry or the id
//   @<key>              one per property (skipped on name collision)
//   @startOffset ...    start/end offset, line and col when present
//
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "uast_bridge/engine/uast_engine.h"
#include "uast_bridge/engine/xml_ll.hpp"

namespace uast_bridge::engine
{

using RoleNames = std::unordered_map<uint16_t, std::string>;

/// Attribute name used for a role, e.g. "roleIdentifier" or "role12".
[[nodiscard]] std::string role_attribute_name(uint16_t role, const RoleNames & names);

/**
 * Project the tree under root into a fresh document.
 *
 * @param iface Host callback table
 * @param names Registered role names
 * @param root Handle of the root node (must be non-zero)
 * @return The document; its root element corresponds to root
 */
[[nodiscard]] xml_ll::Document project_tree(
  const UastNodeIface & iface, const RoleNames & names, uintptr_t root);

/// Handle stored in an element built by project_tree (0 for other nodes).
[[nodiscard]] inline uintptr_t handle_of(const xmlNode * node) noexcept
{
  if (node == nullptr || node->type != XML_ELEMENT_NODE) return 0;
  return reinterpret_cast<uintptr_t>(node->_private);
}

}  // namespace uast_bridge::engine
