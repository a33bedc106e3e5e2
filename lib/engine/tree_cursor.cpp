// uast_bridge/engine/tree_cursor.cpp - Lazy tree traversal implementation
#include "uast_bridge/engine/tree_cursor.hpp"

namespace uast_bridge::engine
{

TreeCursor::TreeCursor(const UastNodeIface & iface, uintptr_t root, CursorOrder order)
: iface_(iface), order_(order)
{
  if (root == 0) return;
  if (order_ == CursorOrder::PostOrder) {
    push_frame(root);
  } else {
    pending_.push_back(root);
  }
}

uintptr_t TreeCursor::next()
{
  switch (order_) {
    case CursorOrder::PreOrder:
      return next_pre_order();
    case CursorOrder::PostOrder:
      return next_post_order();
    case CursorOrder::LevelOrder:
      return next_level_order();
  }
  return 0;
}

uintptr_t TreeCursor::next_pre_order()
{
  if (pending_.empty()) return 0;

  const uintptr_t node = pending_.back();
  pending_.pop_back();

  // Reverse push so the first child is visited first.
  for (int i = iface_.children_size(node) - 1; i >= 0; --i) {
    const uintptr_t child = iface_.child_at(node, i);
    if (child != 0) pending_.push_back(child);
  }
  return node;
}

uintptr_t TreeCursor::next_level_order()
{
  if (pending_.empty()) return 0;

  const uintptr_t node = pending_.front();
  pending_.pop_front();

  const int count = iface_.children_size(node);
  for (int i = 0; i < count; ++i) {
    const uintptr_t child = iface_.child_at(node, i);
    if (child != 0) pending_.push_back(child);
  }
  return node;
}

uintptr_t TreeCursor::next_post_order()
{
  while (!frames_.empty()) {
    Frame & top = frames_.back();
    if (top.next_child < top.child_count) {
      const uintptr_t child = iface_.child_at(top.node, top.next_child++);
      // push_frame may reallocate frames_; top is not used afterwards.
      if (child != 0) push_frame(child);
      continue;
    }
    const uintptr_t node = top.node;
    frames_.pop_back();
    return node;
  }
  return 0;
}

void TreeCursor::push_frame(uintptr_t node)
{
  const int count = iface_.children_size(node);
  frames_.push_back(Frame{node, 0, count > 0 ? count : 0});
}

}  // namespace uast_bridge::engine
