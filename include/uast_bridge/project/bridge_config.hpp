// uast_bridge/project/bridge_config.hpp - Bridge configuration (uastq.yaml)
//
// Parses and validates uastq.yaml. Used by the uastq tool and by hosts that
// want role names in their XPath queries.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "uast_bridge/bridge/iterator.hpp"
#include "uast_bridge/uast/node.hpp"

namespace uast_bridge
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Iterator defaults section.
 */
struct IteratorConfig
{
  /// Order used when the caller does not pick one
  TreeOrder default_order = TreeOrder::PreOrder;
};

/**
 * Complete bridge configuration (uastq.yaml).
 */
struct BridgeConfig
{
  /// Role id -> name, used for "role<Name>" XPath attributes
  std::map<Role, std::string> role_names;

  IteratorConfig iterator;

  /// Directory containing uastq.yaml (empty when parsed from text)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a bridge configuration.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  BridgeConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(BridgeConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Parse a configuration from YAML text.
 *
 * @param yaml_text Contents of a uastq.yaml file
 * @return ConfigLoadResult with the parsed config or error message
 */
[[nodiscard]] ConfigLoadResult parse_bridge_config(std::string_view yaml_text);

/**
 * Load a configuration from a uastq.yaml file.
 *
 * @param config_path Path to uastq.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_bridge_config(const std::filesystem::path & config_path);

/**
 * Find uastq.yaml by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to the nearest uastq.yaml file, std::nullopt if none exists
 */
[[nodiscard]] std::optional<std::filesystem::path> find_bridge_config(
  const std::filesystem::path & start_dir);

/**
 * Register the configured role names with the engine.
 *
 * Runs under the evaluation lock, so it never overlaps a filter() call.
 *
 * @throws BridgeError if called while an evaluation is open on this thread
 */
void apply_bridge_config(const BridgeConfig & config);

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_bridge_config_file_name = "uastq.yaml";

}  // namespace uast_bridge
