#pragma once

#include <cstdint>
#include <string>

namespace binview::ui {

// UTF-8 text width utilities (one column per code point, SGR skipped)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Cut s to at most w visible columns; no ellipsis, no padding.
std::string truncate_cols(const std::string& s, int w);

// Fixed-width uppercase hex
std::string hex8(uint64_t v);
std::string hex2(uint8_t v);

} // namespace binview::ui
