#pragma once

#include <string_view>

namespace binview::ui {

enum class KeyToken {
  Char,     // single printable byte, see KeyEvent::ch
  Up, Down, Left, Right,
  Escape,
  F2,
  CtrlA, CtrlB, CtrlE, CtrlF, CtrlL, CtrlN, CtrlP,
  Unknown,
};

struct KeyEvent {
  KeyToken token{KeyToken::Unknown};
  char ch{0};
};

// Decode the bytes of one tty read. A sequence split across two reads is
// not reassembled; its pieces decode as Escape, Char or Unknown.
[[nodiscard]] KeyEvent decode_key(std::string_view raw);

[[nodiscard]] constexpr KeyEvent char_key(char c) { return KeyEvent{KeyToken::Char, c}; }
[[nodiscard]] constexpr KeyEvent named_key(KeyToken t) { return KeyEvent{t, 0}; }

} // namespace binview::ui
