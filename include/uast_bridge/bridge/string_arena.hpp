// uast_bridge/bridge/string_arena.hpp - Batch-released string export buffer
//
// Host strings handed to the engine must be NUL-terminated and must stay put
// until the engine is done with them. The arena copies them into a
// std::pmr::monotonic_buffer_resource and frees everything in one release().
//
#pragma once

#include <cstddef>
#include <memory_resource>
#include <string_view>

namespace uast_bridge
{

/// String owned by a StringArena; valid until the arena's next release().
using ExternalString = const char *;

/**
 * Arena for strings exported across the engine boundary.
 *
 * One arena serves one boundary call. Nothing is freed individually; the
 * arena grows for as long as the call exports strings and release() drops
 * all of them at once.
 *
 * Example:
 * @code
 *   StringArena arena;
 *   ExternalString s = arena.export_string("FunctionDef");
 *   engine_call(s);
 *   arena.release();  // s is dangling from here on
 * @endcode
 */
class StringArena
{
public:
  /// Default initial buffer size (4KB)
  static constexpr size_t k_default_buffer_size = size_t{4} * size_t{1024};

  explicit StringArena(size_t initial_buffer_size = k_default_buffer_size)
  : resource_(initial_buffer_size)
  {
  }

  ~StringArena() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  StringArena(const StringArena &) = delete;
  StringArena & operator=(const StringArena &) = delete;
  StringArena(StringArena &&) = delete;
  StringArena & operator=(StringArena &&) = delete;

  /**
   * Copy text into the arena and append a NUL terminator.
   *
   * Embedded NUL bytes are copied as-is; a C reader will see the text
   * truncated at the first one.
   *
   * @param text Host text to export
   * @return Stable, NUL-terminated copy owned by the arena
   */
  [[nodiscard]] ExternalString export_string(std::string_view text);

  /**
   * Free every string exported since the last release.
   */
  void release() noexcept;

  /// Number of strings exported since the last release
  [[nodiscard]] size_t size() const noexcept { return count_; }

  /// Bytes handed out since the last release (terminators included)
  [[nodiscard]] size_t bytes() const noexcept { return bytes_; }

  [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

private:
  std::pmr::monotonic_buffer_resource resource_;
  size_t count_ = 0;
  size_t bytes_ = 0;
};

}  // namespace uast_bridge
