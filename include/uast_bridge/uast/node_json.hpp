// uast_bridge/uast/node_json.hpp - JSON serialization for UAST trees
//
// Uses the UAST wire field names (InternalType, Token, Children, Roles,
// Properties, StartPosition, EndPosition) so trees exported by other UAST
// tooling load unchanged.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

#include "uast_bridge/uast/node.hpp"

namespace uast_bridge
{

/**
 * Serialize a node and its whole subtree.
 *
 * @param node The node to serialize
 * @return JSON object; absent positions and empty fields are omitted
 */
[[nodiscard]] nlohmann::json to_json(const Node & node);

/**
 * Serialize a node without its children.
 *
 * Children are replaced by a "ChildrenCount" field. Used for compact
 * result listings.
 */
[[nodiscard]] nlohmann::json to_json_summary(const Node & node);

/**
 * Build a tree from its JSON form.
 *
 * Every field is optional. Fields of the wrong JSON type throw.
 *
 * @param j JSON object describing the root node
 * @return The root of the newly built tree
 * @throws nlohmann::json::exception on type mismatches
 * @throws std::runtime_error if a node is not a JSON object
 */
[[nodiscard]] NodePtr node_from_json(const nlohmann::json & j);

/**
 * Load a tree from a JSON file.
 *
 * @throws std::runtime_error if the file cannot be read or is malformed
 */
[[nodiscard]] NodePtr load_tree(const std::filesystem::path & path);

}  // namespace uast_bridge
