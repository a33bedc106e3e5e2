// uast_bridge/bridge/handle.hpp - Node identity <-> engine handle mapping
//
// A handle is the node's address as an integer. There is no registry: the
// mapping is valid only while the node stays alive, which NodePin
// guarantees for everything reachable from a pinned root.
//
#pragma once

#include <cstdint>
#include <utility>

#include "uast_bridge/uast/node.hpp"

namespace uast_bridge
{

/// Opaque, non-owning alias for a node, valid for one boundary call.
using Handle = std::uintptr_t;

/// Handle value meaning "no node".
inline constexpr Handle k_null_handle = 0;

[[nodiscard]] inline Handle to_handle(const Node * node) noexcept
{
  return reinterpret_cast<Handle>(node);
}

[[nodiscard]] inline const Node * from_handle(Handle handle) noexcept
{
  return reinterpret_cast<const Node *>(handle);
}

/**
 * Keeps a tree alive while its handles are in use by the engine.
 *
 * Holding the root keeps every descendant alive as long as the tree is not
 * restructured. Nodes handed back to the caller share ownership of the root
 * (aliasing shared_ptr), so a result can never outlive the tree it points
 * into.
 */
class NodePin
{
public:
  NodePin() = default;
  explicit NodePin(NodePtr root) : root_(std::move(root)) {}

  [[nodiscard]] const NodePtr & root() const noexcept { return root_; }

  [[nodiscard]] Handle root_handle() const noexcept { return to_handle(root_.get()); }

  /**
   * Turn a handle into a caller-facing reference.
   *
   * @param handle Handle of a node reachable from the pinned root
   * @return Reference that keeps the pinned root alive, or nullptr for 0
   */
  [[nodiscard]] NodePtr alias(Handle handle) const noexcept
  {
    if (handle == k_null_handle) return nullptr;
    return NodePtr(root_, from_handle(handle));
  }

private:
  NodePtr root_;
};

}  // namespace uast_bridge
