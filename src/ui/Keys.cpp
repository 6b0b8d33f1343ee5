#include "ui/Keys.hpp"

namespace binview::ui {

KeyEvent decode_key(std::string_view raw) {
  if (raw.empty()) return {};
  unsigned char c = (unsigned char)raw[0];
  if (raw.size() == 1) {
    switch (c) {
      case 0x01: return named_key(KeyToken::CtrlA);
      case 0x02: return named_key(KeyToken::CtrlB);
      case 0x05: return named_key(KeyToken::CtrlE);
      case 0x06: return named_key(KeyToken::CtrlF);
      case 0x0C: return named_key(KeyToken::CtrlL);
      case 0x0E: return named_key(KeyToken::CtrlN);
      case 0x10: return named_key(KeyToken::CtrlP);
      case 0x1B: return named_key(KeyToken::Escape);
      default: break;
    }
    if (0x20 <= c && c <= 0x7E) return char_key((char)c);
    return {};
  }
  // ESC [ A..D (normal cursor mode) or ESC O A..D (application mode)
  if (c == 0x1B && raw.size() == 3 && (raw[1] == '[' || raw[1] == 'O')) {
    switch (raw[2]) {
      case 'A': return named_key(KeyToken::Up);
      case 'B': return named_key(KeyToken::Down);
      case 'C': return named_key(KeyToken::Right);
      case 'D': return named_key(KeyToken::Left);
      case 'Q': if (raw[1] == 'O') return named_key(KeyToken::F2); break;
      default: break;
    }
  }
  return {};
}

} // namespace binview::ui
