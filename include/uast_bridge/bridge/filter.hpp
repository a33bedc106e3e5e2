// uast_bridge/bridge/filter.hpp - XPath query evaluation over a host tree
#pragma once

#include <string_view>
#include <vector>

#include "uast_bridge/uast/node.hpp"

namespace uast_bridge
{

/**
 * Evaluate an XPath query against the tree rooted at root.
 *
 * The returned nodes are the tree's own nodes (no copies), in the order the
 * engine reports them. Each returned reference keeps root alive.
 * Thread-safe; concurrent calls are serialized by the evaluation lock.
 *
 * @param root Root of the tree to query
 * @param query XPath expression; an empty query returns an empty result
 *              without calling the engine
 * @return Matching nodes
 * @throws QueryError if root is null, the query contains a NUL byte, or the
 *         engine rejects or fails to evaluate the query (out of memory included)
 * @throws BridgeError if called from inside another evaluation on this thread
 */
[[nodiscard]] std::vector<NodePtr> filter(const NodePtr & root, std::string_view query);

}  // namespace uast_bridge
