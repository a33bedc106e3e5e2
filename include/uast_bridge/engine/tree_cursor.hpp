// uast_bridge/engine/tree_cursor.hpp - Lazy tree traversal over node handles
//
// The cursor only stores handles and asks the host for children when it
// needs them, so a node's children are requested at most once per traversal.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include "uast_bridge/engine/uast_engine.h"

namespace uast_bridge::engine
{

enum class CursorOrder {
  PreOrder = UAST_PRE_ORDER,
  PostOrder = UAST_POST_ORDER,
  LevelOrder = UAST_LEVEL_ORDER,
};

/// Whether order is one of the CursorOrder values.
[[nodiscard]] constexpr bool is_valid_cursor_order(int order) noexcept
{
  return order == UAST_PRE_ORDER || order == UAST_POST_ORDER || order == UAST_LEVEL_ORDER;
}

class TreeCursor
{
public:
  TreeCursor(const UastNodeIface & iface, uintptr_t root, CursorOrder order);

  TreeCursor(const TreeCursor &) = delete;
  TreeCursor & operator=(const TreeCursor &) = delete;

  /// Next handle in traversal order, or 0 once exhausted.
  [[nodiscard]] uintptr_t next();

  [[nodiscard]] CursorOrder order() const noexcept { return order_; }

private:
  struct Frame
  {
    uintptr_t node;
    int next_child;
    int child_count;
  };

  uintptr_t next_pre_order();
  uintptr_t next_post_order();
  uintptr_t next_level_order();

  void push_frame(uintptr_t node);

  UastNodeIface iface_;
  CursorOrder order_;

  // Pre-order: stack of pending nodes (top = next). Level-order: FIFO queue.
  std::deque<uintptr_t> pending_;

  // Post-order: path from root to the node being expanded.
  std::vector<Frame> frames_;
};

}  // namespace uast_bridge::engine
