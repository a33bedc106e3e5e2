// uast_bridge/uast/node.cpp - UAST node helpers
#include "uast_bridge/uast/node.hpp"

#include <vector>

namespace uast_bridge
{

MutableNodePtr make_node(std::string internal_type, std::string token)
{
  auto node = std::make_shared<Node>();
  node->internal_type = std::move(internal_type);
  node->token = std::move(token);
  return node;
}

size_t count_nodes(const Node & root)
{
  // Explicit stack: generated trees can be deep enough to exhaust recursion.
  size_t count = 0;
  std::vector<const Node *> pending{&root};
  while (!pending.empty()) {
    const Node * n = pending.back();
    pending.pop_back();
    ++count;
    for (const auto & child : n->children) {
      if (child) pending.push_back(child.get());
    }
  }
  return count;
}

}  // namespace uast_bridge
