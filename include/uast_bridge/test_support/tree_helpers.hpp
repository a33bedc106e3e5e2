// uast_bridge/test_support/tree_helpers.hpp - sample trees for unit tests
//
// The sample tree (roles in braces, positions as offset:line:col):
//
//   File                        0:1:1 - 40:4:1
//   |- FunctionDef "main" {1}   0:1:1 - 38:3:2   properties b=2, a=1
//   |  |- Identifier "x" {2}    9:1:10 - 10:1:11
//   |  `- Call "print"
//   |     `- Identifier "y" {2}
//   `- Comment "# done"
//
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "uast_bridge/uast/node.hpp"

namespace uast_bridge::test_support
{

struct SampleTree
{
  NodePtr root;
  NodePtr function_def;
  NodePtr ident_x;
  NodePtr call;
  NodePtr ident_y;
  NodePtr comment;

  [[nodiscard]] size_t size() const noexcept { return 6; }
};

[[nodiscard]] inline SampleTree make_sample_tree()
{
  auto ident_x = make_node("Identifier", "x");
  ident_x->roles = {2};
  ident_x->start_position = Position{9, 1, 10};
  ident_x->end_position = Position{10, 1, 11};

  auto ident_y = make_node("Identifier", "y");
  ident_y->roles = {2};

  auto call = make_node("Call", "print");
  call->children = {ident_y};

  auto function_def = make_node("FunctionDef", "main");
  function_def->roles = {1};
  function_def->properties = {{"b", "2"}, {"a", "1"}};
  function_def->start_position = Position{0, 1, 1};
  function_def->end_position = Position{38, 3, 2};
  function_def->children = {ident_x, call};

  auto comment = make_node("Comment", "# done");

  auto root = make_node("File");
  root->start_position = Position{0, 1, 1};
  root->end_position = Position{40, 4, 1};
  root->children = {function_def, comment};

  SampleTree t;
  t.root = root;
  t.function_def = function_def;
  t.ident_x = ident_x;
  t.call = call;
  t.ident_y = ident_y;
  t.comment = comment;
  return t;
}

/**
 * A complete tree of the given depth where every inner node has `fanout`
 * children. Node tokens are their pre-order index.
 */
[[nodiscard]] inline NodePtr make_wide_tree(int depth, int fanout, const std::string & type = "N")
{
  int counter = 0;
  struct Builder
  {
    int fanout;
    const std::string & type;
    int & counter;

    MutableNodePtr build(int remaining)
    {
      auto node = make_node(type, std::to_string(counter++));
      if (remaining > 0) {
        for (int i = 0; i < fanout; ++i) {
          node->children.push_back(build(remaining - 1));
        }
      }
      return node;
    }
  };
  Builder b{fanout, type, counter};
  return b.build(depth);
}

/// Tokens of the given nodes, for readable EXPECT_EQ comparisons.
[[nodiscard]] inline std::vector<std::string> tokens_of(const std::vector<NodePtr> & nodes)
{
  std::vector<std::string> out;
  out.reserve(nodes.size());
  for (const auto & n : nodes) {
    out.push_back(n ? n->token : std::string("<null>"));
  }
  return out;
}

}  // namespace uast_bridge::test_support
