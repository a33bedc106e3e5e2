// uastq - UAST query command line interface
//
// Usage:
//   uastq filter <tree.json> <xpath> [--config <uastq.yaml>] [--full]
//   uastq iterate <tree.json> [--order <order>] [--config <uastq.yaml>] [--full]
//
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "uast_bridge/uast_bridge.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "uastq - UAST query tool v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  filter <tree.json> <xpath>   Print the nodes matching an XPath query\n"
            << "  iterate <tree.json>          Print every node in traversal order\n\n"
            << "Options:\n"
            << "  --order <order>              pre-order | post-order | level-order\n"
            << "  -c, --config <path>          Configuration file (default: search uastq.yaml)\n"
            << "  --full                       Print whole subtrees instead of summaries\n"
            << "  -v, --verbose                Verbose output\n"
            << "  -h, --help                   Show this help message\n";
}

nlohmann::json render(const uast_bridge::NodePtr & node, bool full)
{
  return full ? uast_bridge::to_json(*node) : uast_bridge::to_json_summary(*node);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string config_path;
  std::string order;
  bool full = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--order") {
      if (i + 1 < argc) {
        args.order = argv[++i];
      }
    } else if (arg == "--full") {
      args.full = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else {
      // XPath expressions may start with any character, so keep everything else
      args.positional.push_back(std::move(arg));
    }
  }

  return args;
}

// ============================================================================
// Setup
// ============================================================================

/// Load and apply the configuration. Returns std::nullopt after reporting an error.
std::optional<uast_bridge::BridgeConfig> setup_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = args.config_path;
  } else {
    config_path = uast_bridge::find_bridge_config(fs::current_path());
  }

  if (!config_path) {
    if (args.verbose) {
      std::cerr << "No " << uast_bridge::k_bridge_config_file_name << " found, using defaults\n";
    }
    return uast_bridge::BridgeConfig{};
  }

  const auto result = uast_bridge::load_bridge_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  uast_bridge::apply_bridge_config(result.config);
  return result.config;
}

uast_bridge::NodePtr load_input(const std::string & path, bool verbose)
{
  if (verbose) {
    std::cerr << "Loading: " << path << "\n";
  }
  auto root = uast_bridge::load_tree(path);
  if (verbose) {
    std::cerr << "Loaded " << uast_bridge::count_nodes(*root) << " nodes\n";
  }
  return root;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_filter(const CommandArgs & args)
{
  if (args.positional.size() != 2) {
    std::cerr << "error: tree file and query required\n";
    std::cerr << "usage: uastq filter <tree.json> <xpath>\n";
    return 1;
  }

  const auto config = setup_config(args);
  if (!config) return 1;

  try {
    const auto root = load_input(args.positional[0], args.verbose);
    const auto matches = uast_bridge::filter(root, args.positional[1]);

    nlohmann::json out = nlohmann::json::array();
    for (const auto & node : matches) {
      out.push_back(render(node, args.full));
    }
    std::cout << out.dump(2) << "\n";

    if (args.verbose) {
      std::cerr << matches.size() << " matching nodes\n";
    }
    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_iterate(const CommandArgs & args)
{
  if (args.positional.size() != 1) {
    std::cerr << "error: tree file required\n";
    std::cerr << "usage: uastq iterate <tree.json> [--order <order>]\n";
    return 1;
  }

  const auto config = setup_config(args);
  if (!config) return 1;

  uast_bridge::TreeOrder order = config->iterator.default_order;
  if (!args.order.empty()) {
    const auto parsed = uast_bridge::parse_tree_order(args.order);
    if (!parsed) {
      std::cerr << "error: unknown traversal order '" << args.order << "'\n";
      return 1;
    }
    order = *parsed;
  }

  try {
    const auto root = load_input(args.positional[0], args.verbose);
    auto it = uast_bridge::Iterator::create(root, order);

    nlohmann::json out = nlohmann::json::array();
    for (const auto & node : it.iterate()) {
      out.push_back(render(node, args.full));
    }
    it.dispose();
    std::cout << out.dump(2) << "\n";

    if (args.verbose) {
      std::cerr << out.size() << " nodes visited (" << uast_bridge::to_string(order) << ")\n";
    }
    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "filter") {
    return cmd_filter(args);
  }

  if (args.command == "iterate") {
    return cmd_iterate(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
