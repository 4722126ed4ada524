#pragma once
#include <cstdint>

namespace xa {

enum class KeyCode : std::uint8_t {
  None = 0, Char, Space, Delete, Backspace
};

// Generic key event, not tied to any windowing toolkit.
struct KeyEvent {
  KeyCode code{KeyCode::None};
  char ch{0};            // valid when code == Char
  bool ctrl{false};
  bool meta{false};      // Cmd on macOS
  bool shift{false};

  static KeyEvent character(char c, bool ctrl = false, bool shift = false) {
    KeyEvent e;
    e.code = KeyCode::Char;
    e.ch = c;
    e.ctrl = ctrl;
    e.shift = shift;
    return e;
  }
  static KeyEvent key(KeyCode code) {
    KeyEvent e;
    e.code = code;
    return e;
  }
};

} // namespace xa
