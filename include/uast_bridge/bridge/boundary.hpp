// uast_bridge/bridge/boundary.hpp - Critical section around engine calls
//
// The engine is single-threaded and keeps global state, so every call into it
// happens inside a BoundaryScope. A scope:
//   1. takes the evaluation or the iteration lock (they are independent),
//   2. pins the root the engine is about to see,
//   3. installs a string arena and a property-order cache that the node
//      callbacks find through BoundaryScope::current().
// Everything is undone in reverse order when the scope ends, on every exit
// path.
//
#pragma once

#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "uast_bridge/bridge/handle.hpp"
#include "uast_bridge/bridge/string_arena.hpp"
#include "uast_bridge/uast/node.hpp"

namespace uast_bridge
{

enum class BoundaryKind {
  Evaluation,  ///< Query evaluation and engine configuration
  Iteration,   ///< Traversal cursors
};

[[nodiscard]] std::string_view to_string(BoundaryKind kind) noexcept;

/// Process-wide lock serializing one kind of boundary call.
[[nodiscard]] std::mutex & boundary_mutex(BoundaryKind kind) noexcept;

/// Install the node callback table in the engine (once per process).
void ensure_engine_initialized();

/**
 * Scoped boundary region.
 *
 * Opening a scope of a kind that is already open on the calling thread
 * throws BridgeError instead of deadlocking. root may be null for calls that
 * configure the engine without touching a tree.
 */
class BoundaryScope
{
public:
  using PropertyOrder = std::vector<const Property *>;

  BoundaryScope(BoundaryKind kind, NodePtr root);
  ~BoundaryScope();

  BoundaryScope(const BoundaryScope &) = delete;
  BoundaryScope & operator=(const BoundaryScope &) = delete;
  BoundaryScope(BoundaryScope &&) = delete;
  BoundaryScope & operator=(BoundaryScope &&) = delete;

  [[nodiscard]] BoundaryKind kind() const noexcept { return kind_; }

  [[nodiscard]] StringArena & arena() noexcept { return arena_; }

  [[nodiscard]] const NodePin & pin() const noexcept { return pin_; }

  /**
   * Properties of node sorted by key (byte-wise lexicographic).
   *
   * Computed on first request and reused for the rest of the scope, so
   * index i names the same key/value pair for every callback in this call.
   */
  [[nodiscard]] const PropertyOrder & sorted_properties(const Node & node);

  /// Scope that was current on this thread when this one opened.
  [[nodiscard]] const BoundaryScope * enclosing() const noexcept { return previous_; }

  /// Innermost scope open on the calling thread, or nullptr.
  [[nodiscard]] static BoundaryScope * current() noexcept;

  /// Whether a scope of kind is open on the calling thread (its lock is held).
  [[nodiscard]] static bool is_open(BoundaryKind kind) noexcept;

  /// Set by node callbacks that could not allocate; checked after the engine call.
  void set_out_of_memory() noexcept { out_of_memory_ = true; }
  [[nodiscard]] bool out_of_memory() const noexcept { return out_of_memory_; }

private:
  // Declaration order is teardown order in reverse: cache, arena, pin, lock.
  BoundaryKind kind_;
  std::unique_lock<std::mutex> lock_;
  NodePin pin_;
  StringArena arena_;
  std::unordered_map<const Node *, PropertyOrder> property_order_;
  BoundaryScope * previous_ = nullptr;
  bool out_of_memory_ = false;
};

}  // namespace uast_bridge
