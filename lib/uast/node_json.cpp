// uast_bridge/uast/node_json.cpp - JSON serialization implementation
//
#include "uast_bridge/uast/node_json.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace uast_bridge
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_position(const Position & p)
{
  return json{{"Offset", p.offset}, {"Line", p.line}, {"Col", p.col}};
}

Position position_from_json(const json & j)
{
  Position p;
  if (j.contains("Offset")) p.offset = j.at("Offset").get<uint32_t>();
  if (j.contains("Line")) p.line = j.at("Line").get<uint32_t>();
  if (j.contains("Col")) p.col = j.at("Col").get<uint32_t>();
  return p;
}

void fill_fields(json & out, const Node & node)
{
  out["InternalType"] = node.internal_type;
  if (!node.token.empty()) {
    out["Token"] = node.token;
  }
  if (!node.roles.empty()) {
    out["Roles"] = node.roles;
  }
  if (!node.properties.empty()) {
    // nlohmann::json objects are key-sorted, so the output is deterministic
    json props = json::object();
    for (const auto & [key, value] : node.properties) {
      props[key] = value;
    }
    out["Properties"] = std::move(props);
  }
  if (node.start_position) {
    out["StartPosition"] = j_position(*node.start_position);
  }
  if (node.end_position) {
    out["EndPosition"] = j_position(*node.end_position);
  }
}

MutableNodePtr node_fields_from_json(const json & j)
{
  if (!j.is_object()) {
    throw std::runtime_error("UAST node must be a JSON object, got " + std::string(j.type_name()));
  }

  auto node = std::make_shared<Node>();
  if (j.contains("InternalType")) {
    node->internal_type = j.at("InternalType").get<std::string>();
  }
  if (j.contains("Token")) {
    node->token = j.at("Token").get<std::string>();
  }
  if (j.contains("Roles")) {
    node->roles = j.at("Roles").get<std::vector<Role>>();
  }
  if (j.contains("Properties")) {
    for (const auto & [key, value] : j.at("Properties").items()) {
      node->properties.emplace(key, value.get<std::string>());
    }
  }
  if (j.contains("StartPosition") && !j.at("StartPosition").is_null()) {
    node->start_position = position_from_json(j.at("StartPosition"));
  }
  if (j.contains("EndPosition") && !j.at("EndPosition").is_null()) {
    node->end_position = position_from_json(j.at("EndPosition"));
  }
  return node;
}

}  // namespace

// ============================================================================
// Serialization
// ============================================================================

json to_json(const Node & node)
{
  json j = json::object();
  fill_fields(j, node);
  if (!node.children.empty()) {
    json children = json::array();
    for (const auto & child : node.children) {
      children.push_back(child ? to_json(*child) : json(nullptr));
    }
    j["Children"] = std::move(children);
  }
  return j;
}

json to_json_summary(const Node & node)
{
  json j = json::object();
  fill_fields(j, node);
  j["ChildrenCount"] = node.children.size();
  return j;
}

// ============================================================================
// Deserialization
// ============================================================================

NodePtr node_from_json(const json & j)
{
  MutableNodePtr node = node_fields_from_json(j);
  if (j.contains("Children")) {
    const json & children = j.at("Children");
    if (!children.is_array()) {
      throw std::runtime_error("UAST node field 'Children' must be an array");
    }
    node->children.reserve(children.size());
    for (const auto & child : children) {
      node->children.push_back(node_from_json(child));
    }
  }
  return node;
}

NodePtr load_tree(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open tree file: " + path.string());
  }

  try {
    const json j = json::parse(in);
    return node_from_json(j);
  } catch (const std::exception & e) {
    throw std::runtime_error("failed to load tree '" + path.string() + "': " + e.what());
  }
}

}  // namespace uast_bridge
