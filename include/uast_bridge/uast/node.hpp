// uast_bridge/uast/node.hpp - UAST node data model
//
// The host-side tree that queries and traversals operate on. Nodes are
// shared between parents and whoever built the tree; a tree must not be
// modified while a boundary call is running over it.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace uast_bridge
{

/// Role tag attached to a node (small integer, named through the role registry)
using Role = uint16_t;

/**
 * A position in the source file the node was parsed from.
 */
struct Position
{
  uint32_t offset = 0;
  uint32_t line = 0;
  uint32_t col = 0;

  [[nodiscard]] bool operator==(const Position & other) const noexcept
  {
    return offset == other.offset && line == other.line && col == other.col;
  }
  [[nodiscard]] bool operator!=(const Position & other) const noexcept
  {
    return !(*this == other);
  }
};

struct Node;

/// Shared, read-only reference to a node
using NodePtr = std::shared_ptr<const Node>;

/// Mutable reference, used while building a tree
using MutableNodePtr = std::shared_ptr<Node>;

/// A single key/value property as stored in Node::properties
using Property = std::pair<const std::string, std::string>;

/**
 * A UAST node.
 *
 * Properties are an unordered mapping; any ordering observed through the
 * bridge is imposed by the bridge, not by this structure.
 */
struct Node
{
  std::string internal_type;
  std::string token;
  std::vector<NodePtr> children;
  std::vector<Role> roles;
  std::unordered_map<std::string, std::string> properties;
  std::optional<Position> start_position;
  std::optional<Position> end_position;
};

/**
 * Create a node with the given internal type and token.
 */
[[nodiscard]] MutableNodePtr make_node(std::string internal_type, std::string token = {});

/**
 * Count the nodes reachable from root (root included).
 */
[[nodiscard]] size_t count_nodes(const Node & root);

}  // namespace uast_bridge
