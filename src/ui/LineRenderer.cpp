#include "ui/LineRenderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"

namespace binview::ui {

static constexpr bool is_continuation(uint8_t c) { return 0x80 <= c && c <= 0xBF; }

int utf8_sequence_length(const model::Record& rec, size_t i) {
  if (i >= rec.size()) return 0;
  uint8_t c = rec[i];
  int len = 0;
  if (0x20 <= c && c <= 0x7E) len = 1;
  else if (0xC2 <= c && c <= 0xDF) len = 2;
  else if (0xE0 <= c && c <= 0xEF) len = 3;
  else if (0xF0 <= c && c <= 0xF4) len = 4;
  if (len == 0) return 0;
  if (i + (size_t)len > rec.size()) return 0;
  for (int j = 1; j < len; ++j)
    if (!is_continuation(rec[i + j])) return 0;
  return len;
}

std::string render_record(uint64_t address, int cursor_col,
                          const model::Record& rec, const Palette& palette) {
  std::string out;
  out.reserve(160 + rec.size() * 16);
  out += hex8(address);
  out += ' ';

  // Hex panel: bytes alternate between two attributes in groups of four.
  for (size_t i = 0; i < rec.size(); ++i) {
    if (i > 0) { out += kReset; out += ' '; }
    if ((int)i == cursor_col) out += palette.cursor;
    else if (((i >> 2) & 1) == 0) out += palette.cell1;
    else out += palette.cell2;
    out += hex2(rec[i]);
  }
  out += kReset;
  // Every byte field is 3 columns wide including its leading space; the
  // address already supplies the first one.
  if (!rec.empty()) out += ' ';
  for (size_t i = rec.size(); i < model::kRecordSize; ++i) out += "   ";

  // Character panel
  for (size_t i = 0; i < rec.size();) {
    int len = utf8_sequence_length(rec, i);
    if (len == 0) {
      out += ((int)i == cursor_col) ? palette.cursor : palette.cell1;
      out += '.';
      ++i;
      continue;
    }
    bool under_cursor = (int)i <= cursor_col && cursor_col < (int)i + len;
    out += under_cursor ? palette.cursor : palette.cell1;
    out.append(reinterpret_cast<const char*>(rec.data() + i), (size_t)len);
    // Pad wide glyphs so the panel keeps roughly one column per byte.
    if (len == 3) out += ' ';
    else if (len == 4) out += "  ";
    i += (size_t)len;
  }
  out += kEraseLine;
  return out;
}

} // namespace binview::ui
