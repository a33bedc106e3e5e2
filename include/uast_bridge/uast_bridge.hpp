// uast_bridge/uast_bridge.hpp - Public API of the UAST query bridge
//
// Query and traverse host UAST trees through the UAST engine:
//
//   auto matches = uast_bridge::filter(root, "//Identifier[@token='x']");
//
//   auto it = uast_bridge::Iterator::create(root, uast_bridge::TreeOrder::LevelOrder);
//   for (const auto & node : it.iterate()) { ... }
//
#pragma once

#include "uast_bridge/bridge/errors.hpp"
#include "uast_bridge/bridge/filter.hpp"
#include "uast_bridge/bridge/iterator.hpp"
#include "uast_bridge/project/bridge_config.hpp"
#include "uast_bridge/uast/node.hpp"
#include "uast_bridge/uast/node_json.hpp"
