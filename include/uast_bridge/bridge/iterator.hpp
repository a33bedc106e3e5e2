// uast_bridge/bridge/iterator.hpp - Incremental tree traversal through the engine
//
// Iterator owns one engine traversal cursor and walks it under the iteration
// lock, one node per next() call:
//
//   Active --next() returns nullptr--> Finished
//   Active/Finished --dispose()------> Disposed
//
// The iterator keeps the root alive for its whole life because the engine
// cursor holds handles between calls.
//
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

#include "uast_bridge/engine/uast_engine.h"
#include "uast_bridge/uast/node.hpp"

namespace uast_bridge
{

// ============================================================================
// Traversal order
// ============================================================================

enum class TreeOrder {
  PreOrder = UAST_PRE_ORDER,
  PostOrder = UAST_POST_ORDER,
  LevelOrder = UAST_LEVEL_ORDER,  ///< breadth-first
};

[[nodiscard]] std::string_view to_string(TreeOrder order) noexcept;

/**
 * Parse a traversal order name.
 *
 * Accepts "pre-order", "preorder", "pre", "post-order", "postorder", "post",
 * "level-order", "levelorder", "level" and "breadth-first".
 */
[[nodiscard]] std::optional<TreeOrder> parse_tree_order(std::string_view text) noexcept;

// ============================================================================
// Iterator
// ============================================================================

class Iterator
{
public:
  enum class State {
    Active,
    Finished,
    Disposed,
  };

  class Range;

  /**
   * Start a traversal of the tree under root.
   *
   * @param root Root of the traversal
   * @param order Traversal order, passed to the engine unmodified
   * @throws IteratorError if the engine cannot create a cursor (null root,
   *         unknown order)
   */
  [[nodiscard]] static Iterator create(NodePtr root, TreeOrder order);

  Iterator(const Iterator &) = delete;
  Iterator & operator=(const Iterator &) = delete;

  Iterator(Iterator && other) noexcept;
  Iterator & operator=(Iterator && other) noexcept;

  /// Disposes the cursor if the owner did not.
  ~Iterator();

  /**
   * Advance the traversal.
   *
   * @return The next node, or nullptr at end-of-traversal
   * @throws StateError if end-of-traversal was already returned or the
   *         iterator was disposed
   * @throws IteratorError if the engine failed to advance (the iterator is
   *         Finished afterwards)
   */
  [[nodiscard]] NodePtr next();

  /// Release the engine cursor. Idempotent. Safe inside an open iteration scope.
  void dispose() noexcept;

  /**
   * Lazy single-pass view equivalent to calling next() until it returns
   * nullptr. The view does not dispose the iterator.
   *
   * @code
   *   auto it = Iterator::create(root, TreeOrder::PreOrder);
   *   for (const NodePtr & n : it.iterate()) { ... }
   * @endcode
   */
  [[nodiscard]] Range iterate() noexcept;

  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] bool is_active() const noexcept { return state_ == State::Active; }
  [[nodiscard]] TreeOrder order() const noexcept { return order_; }
  [[nodiscard]] const NodePtr & root() const noexcept { return root_; }

private:
  Iterator(NodePtr root, TreeOrder order, UastIterator * cursor) noexcept;

  void release_cursor() noexcept;

  NodePtr root_;
  TreeOrder order_ = TreeOrder::PreOrder;
  UastIterator * cursor_ = nullptr;
  State state_ = State::Disposed;
};

/**
 * Input range over the remaining nodes of an Iterator.
 */
class Iterator::Range
{
public:
  class iterator
  {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = NodePtr;
    using difference_type = std::ptrdiff_t;
    using pointer = const NodePtr *;
    using reference = const NodePtr &;

    /// End-of-sequence sentinel
    iterator() = default;
    explicit iterator(Iterator * owner) : owner_(owner) { advance(); }

    [[nodiscard]] reference operator*() const noexcept { return current_; }
    [[nodiscard]] pointer operator->() const noexcept { return &current_; }

    iterator & operator++()
    {
      advance();
      return *this;
    }
    void operator++(int) { advance(); }

    [[nodiscard]] friend bool operator==(const iterator & a, const iterator & b) noexcept
    {
      return a.owner_ == b.owner_;
    }
    [[nodiscard]] friend bool operator!=(const iterator & a, const iterator & b) noexcept
    {
      return a.owner_ != b.owner_;
    }

  private:
    void advance();

    Iterator * owner_ = nullptr;
    NodePtr current_;
  };

  explicit Range(Iterator & owner) noexcept : owner_(&owner) {}

  [[nodiscard]] iterator begin() { return iterator(owner_); }
  [[nodiscard]] iterator end() const noexcept { return iterator(); }

private:
  Iterator * owner_;
};

}  // namespace uast_bridge
