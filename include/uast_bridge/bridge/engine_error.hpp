// uast_bridge/bridge/engine_error.hpp - Ownership of engine error strings
#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

#include "uast_bridge/engine/uast_engine.h"

namespace uast_bridge
{

struct FreeDeleter
{
  void operator()(char * p) const noexcept { std::free(p); }
};

/// malloc'ed string returned by the engine, freed on scope exit.
using EngineString = std::unique_ptr<char, FreeDeleter>;

/**
 * Copy the engine's last error for this thread and free the engine's copy.
 *
 * Must run before the boundary lock is released.
 *
 * @param fallback Message used when the engine did not report one
 */
[[nodiscard]] inline std::string take_engine_error(std::string_view fallback)
{
  const EngineString err(UastEngineLastError());
  if (!err || *err == '\0') {
    return std::string(fallback);
  }
  return std::string(err.get());
}

}  // namespace uast_bridge
