#pragma once
#include "xa/annotation/Annotation.hpp"
#include <string>

namespace xa {

// Annotation colors per variant.
// Colors are "#rrggbb" strings so they pass through the DTO untouched.
struct Palette {
  std::string marker{"#f43f5e"};
  std::string box{"#22c55e"};
  std::string circle{"#3b82f6"};
  std::string ellipse{"#ec4899"};
  std::string line{"#f59e0b"};
  std::string freehand{"#ef4444"};
  std::string ruler{"#8b5cf6"};
  std::string angle{"#06b6d4"};
  std::string text{"#a855f7"};
  std::string tool{"#60a5fa"};          // select / eraser

  // Selection decorations
  std::string selection{"#60a5fa"};
  std::string selectionFill{"rgba(96, 165, 250, 0.15)"};
  std::string handle{"#60a5fa"};
  std::string handleStroke{"#1e3a5f"};
};

Palette defaultPalette();

// Creation-time color for a variant.
const std::string& colorFor(const Palette& p, AnnotationType t);

} // namespace xa
