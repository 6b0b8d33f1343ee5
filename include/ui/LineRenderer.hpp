#pragma once

#include "model/Record.hpp"
#include "ui/Config.hpp"
#include <cstdint>
#include <string>

namespace binview::ui {

inline constexpr int kNoCursor = -1;

// Length of the UTF-8 sequence starting at rec[i]: 1 for printable ASCII,
// 2..4 for a well-formed multi-byte sequence that fits in the record,
// 0 for anything shown as a placeholder.
[[nodiscard]] int utf8_sequence_length(const model::Record& rec, size_t i);

// One display row: address, 16 hex cells and the character panel, ending
// with erase-to-end-of-line. Deterministic for identical inputs.
[[nodiscard]] std::string render_record(uint64_t address, int cursor_col,
                                        const model::Record& rec,
                                        const Palette& palette = default_palette());

} // namespace binview::ui
