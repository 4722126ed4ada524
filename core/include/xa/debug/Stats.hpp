#pragma once
#include <cstdint>

namespace xa {

struct DebugToggles {
  bool traceGestures = false;  // one stderr line per gesture begin/commit/discard
};

struct EngineStats {
  std::uint32_t historyCommits = 0;
  std::uint32_t discardedGestures = 0;
  std::uint32_t erasedShapes = 0;
  std::uint32_t undos = 0;
  std::uint32_t redos = 0;
};

} // namespace xa
