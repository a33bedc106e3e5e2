// uast_bridge/bridge/iterator.cpp - Incremental traversal implementation
#include "uast_bridge/bridge/iterator.hpp"

#include <mutex>
#include <string>
#include <utility>

#include "uast_bridge/bridge/boundary.hpp"
#include "uast_bridge/bridge/engine_error.hpp"
#include "uast_bridge/bridge/errors.hpp"

namespace uast_bridge
{

// ============================================================================
// Traversal order
// ============================================================================

std::string_view to_string(TreeOrder order) noexcept
{
  switch (order) {
    case TreeOrder::PreOrder:
      return "pre-order";
    case TreeOrder::PostOrder:
      return "post-order";
    case TreeOrder::LevelOrder:
      return "level-order";
  }
  return "unknown";
}

std::optional<TreeOrder> parse_tree_order(std::string_view text) noexcept
{
  if (text == "pre-order" || text == "preorder" || text == "pre") {
    return TreeOrder::PreOrder;
  }
  if (text == "post-order" || text == "postorder" || text == "post") {
    return TreeOrder::PostOrder;
  }
  if (text == "level-order" || text == "levelorder" || text == "level" ||
      text == "breadth-first") {
    return TreeOrder::LevelOrder;
  }
  return std::nullopt;
}

// ============================================================================
// Iterator
// ============================================================================

Iterator::Iterator(NodePtr root, TreeOrder order, UastIterator * cursor) noexcept
: root_(std::move(root)), order_(order), cursor_(cursor), state_(State::Active)
{
}

Iterator Iterator::create(NodePtr root, TreeOrder order)
{
  BoundaryScope scope(BoundaryKind::Iteration, root);

  UastIterator * cursor = UastEngineIteratorNew(scope.pin().root_handle(), static_cast<int>(order));
  if (cursor == nullptr) {
    throw IteratorError("iterator creation failed: " + take_engine_error("unknown engine error"));
  }
  return Iterator(std::move(root), order, cursor);
}

Iterator::Iterator(Iterator && other) noexcept
: root_(std::move(other.root_)),
  order_(other.order_),
  cursor_(std::exchange(other.cursor_, nullptr)),
  state_(std::exchange(other.state_, State::Disposed))
{
}

Iterator & Iterator::operator=(Iterator && other) noexcept
{
  if (this != &other) {
    dispose();
    root_ = std::move(other.root_);
    order_ = other.order_;
    cursor_ = std::exchange(other.cursor_, nullptr);
    state_ = std::exchange(other.state_, State::Disposed);
  }
  return *this;
}

Iterator::~Iterator() { dispose(); }

NodePtr Iterator::next()
{
  BoundaryScope scope(BoundaryKind::Iteration, root_);

  if (state_ != State::Active) {
    throw StateError(
      state_ == State::Disposed ? "next() called on disposed iterator"
                                : "next() called on finished iterator");
  }

  const Handle handle = UastEngineIteratorNext(cursor_);
  if (scope.out_of_memory()) {
    state_ = State::Finished;
    throw IteratorError("next() failed: out of memory");
  }
  if (handle == k_null_handle) {
    // 0 is also the engine's failure value; only a recorded error tells them apart.
    const EngineString err(UastEngineLastError());
    state_ = State::Finished;
    if (err && *err != '\0') {
      throw IteratorError("next() failed: " + std::string(err.get()));
    }
    return nullptr;
  }
  return scope.pin().alias(handle);
}

void Iterator::dispose() noexcept
{
  if (cursor_ == nullptr) {
    state_ = State::Disposed;
    return;
  }
  // No callbacks run while freeing a cursor, so the lock is all we need.
  // An iteration scope open on this thread already holds it.
  if (BoundaryScope::is_open(BoundaryKind::Iteration)) {
    release_cursor();
    return;
  }
  const std::lock_guard<std::mutex> lock(boundary_mutex(BoundaryKind::Iteration));
  release_cursor();
}

void Iterator::release_cursor() noexcept
{
  UastEngineIteratorFree(cursor_);
  cursor_ = nullptr;
  state_ = State::Disposed;
}

Iterator::Range Iterator::iterate() noexcept { return Range(*this); }

// ============================================================================
// Range
// ============================================================================

void Iterator::Range::iterator::advance()
{
  if (owner_ == nullptr) return;

  if (!owner_->is_active()) {
    owner_ = nullptr;
    current_.reset();
    return;
  }

  try {
    current_ = owner_->next();
  } catch (const StateError &) {
    // Another consumer finished or disposed the iterator; end the sequence.
    current_.reset();
  }
  if (!current_) {
    owner_ = nullptr;
  }
}

}  // namespace uast_bridge
