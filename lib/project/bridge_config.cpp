// uast_bridge/project/bridge_config.cpp - Bridge configuration implementation
//
#include "uast_bridge/project/bridge_config.hpp"

#include <yaml-cpp/yaml.h>

#include <limits>
#include <system_error>

#include "uast_bridge/bridge/boundary.hpp"
#include "uast_bridge/engine/uast_engine.h"

namespace uast_bridge
{

namespace
{

/// Parse the 'roles' map (id -> name)
bool parse_roles(const YAML::Node & node, BridgeConfig & config, std::string & error)
{
  if (!node.IsMap()) {
    error = "roles must be a map of role id to name";
    return false;
  }

  for (const auto & entry : node) {
    long long id = -1;
    try {
      id = entry.first.as<long long>();
    } catch (const YAML::Exception &) {
      error = "role id must be an integer: '" + entry.first.Scalar() + "'";
      return false;
    }
    if (id < 0 || id > std::numeric_limits<Role>::max()) {
      error = "role id out of range: " + std::to_string(id);
      return false;
    }
    if (!entry.second.IsScalar() || entry.second.Scalar().empty()) {
      error = "role " + std::to_string(id) + " must have a non-empty name";
      return false;
    }
    config.role_names[static_cast<Role>(id)] = entry.second.Scalar();
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, BridgeConfig config)
{
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'roles' section
  if (root["roles"]) {
    std::string error;
    if (!parse_roles(root["roles"], config, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'iterator' section
  if (root["iterator"]) {
    const auto & it = root["iterator"];
    if (it["default_order"]) {
      const std::string order = it["default_order"].as<std::string>();
      const auto parsed = parse_tree_order(order);
      if (!parsed) {
        return ConfigLoadResult::fail(
          "invalid iterator.default_order: '" + order +
          "' (must be 'pre-order', 'post-order' or 'level-order')");
      }
      config.iterator.default_order = *parsed;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_bridge_config(std::string_view yaml_text)
{
  try {
    const YAML::Node root = YAML::Load(std::string(yaml_text));
    return parse_root(root, BridgeConfig{});
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_bridge_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  BridgeConfig config;
  config.config_root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, std::move(config));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_bridge_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path dir = fs::absolute(start_dir, ec);
  if (ec) return std::nullopt;
  if (!fs::is_directory(dir, ec)) dir = dir.parent_path();

  // Walk ancestors until the filesystem root has been checked
  for (fs::path prev; dir != prev; prev = dir, dir = dir.parent_path()) {
    fs::path candidate = dir / k_bridge_config_file_name;
    if (fs::is_regular_file(candidate, ec)) return candidate;
  }
  return std::nullopt;
}

void apply_bridge_config(const BridgeConfig & config)
{
  const BoundaryScope scope(BoundaryKind::Evaluation, nullptr);
  for (const auto & [role, name] : config.role_names) {
    UastEngineRegisterRole(role, name.c_str());
  }
}

}  // namespace uast_bridge
