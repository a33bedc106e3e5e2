// uast_bridge/bridge/string_arena.cpp - String export buffer implementation
#include "uast_bridge/bridge/string_arena.hpp"

#include <cstring>

namespace uast_bridge
{

ExternalString StringArena::export_string(std::string_view text)
{
  char * const ptr = static_cast<char *>(resource_.allocate(text.size() + 1, 1));
  if (!text.empty()) {
    std::memcpy(ptr, text.data(), text.size());
  }
  ptr[text.size()] = '\0';

  ++count_;
  bytes_ += text.size() + 1;
  return ptr;
}

void StringArena::release() noexcept
{
  resource_.release();
  count_ = 0;
  bytes_ = 0;
}

}  // namespace uast_bridge
