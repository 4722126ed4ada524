#pragma once
#include "xa/annotation/Annotation.hpp"
#include "xa/interaction/InputState.hpp"
#include <cstdint>

namespace xa {

enum class ShortcutAction : std::uint8_t {
  None = 0,
  SelectTool,      // tool carried in ShortcutBinding::tool
  ZoomIn,
  ZoomOut,
  PanHold,         // space down; released on key-up
  Undo,
  Redo,
  DeleteSelected
};

struct ShortcutBinding {
  ShortcutAction action{ShortcutAction::None};
  Tool tool{Tool::Select};
};

// v select, p marker, b box, c circle, o ellipse, l line, d freehand,
// m ruler, a angle, t text, e eraser, +/= zoom in, - zoom out, space pan,
// Ctrl/Cmd+Z undo, Ctrl/Cmd+Shift+Z redo, Delete/Backspace delete.
ShortcutBinding mapShortcut(const KeyEvent& e);

} // namespace xa
