#include "xa/interaction/Shortcuts.hpp"

namespace xa {

namespace {

ShortcutBinding toolBinding(Tool t) {
  return {ShortcutAction::SelectTool, t};
}

} // namespace

ShortcutBinding mapShortcut(const KeyEvent& e) {
  switch (e.code) {
    case KeyCode::Space:
      return {ShortcutAction::PanHold, Tool::Select};
    case KeyCode::Delete:
    case KeyCode::Backspace:
      return {ShortcutAction::DeleteSelected, Tool::Select};
    case KeyCode::None:
      return {};
    case KeyCode::Char:
      break;
  }

  char c = e.ch;
  if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');

  if (c == 'z') {
    if (!e.ctrl && !e.meta) return {};
    return {e.shift ? ShortcutAction::Redo : ShortcutAction::Undo, Tool::Select};
  }
  // Leave Ctrl/Cmd chords (copy, paste, reload) to the host.
  if (e.ctrl || e.meta) return {};

  switch (c) {
    case 'v': return toolBinding(Tool::Select);
    case 'p': return toolBinding(Tool::Marker);
    case 'b': return toolBinding(Tool::Box);
    case 'c': return toolBinding(Tool::Circle);
    case 'o': return toolBinding(Tool::Ellipse);
    case 'l': return toolBinding(Tool::Line);
    case 'd': return toolBinding(Tool::Freehand);
    case 'm': return toolBinding(Tool::Ruler);
    case 'a': return toolBinding(Tool::Angle);
    case 't': return toolBinding(Tool::Text);
    case 'e': return toolBinding(Tool::Eraser);
    case '+':
    case '=': return {ShortcutAction::ZoomIn, Tool::Select};
    case '-': return {ShortcutAction::ZoomOut, Tool::Select};
    case ' ': return {ShortcutAction::PanHold, Tool::Select};
    default:  return {};
  }
}

} // namespace xa
