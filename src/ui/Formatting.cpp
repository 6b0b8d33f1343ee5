#include "ui/Formatting.hpp"
#include <cstdio>

namespace binview::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    // Skip ANSI escape sequences
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // skip final byte
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    i += len;
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    // Copy ANSI escape sequences without counting them
    if (s[i] == '\x1B' && i+1 < s.size() && s[i+1] == '[') {
      size_t start = i;
      i += 2;
      while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
      if (i < s.size()) i++; // include final byte
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string truncate_cols(const std::string& s, int w) {
  if (w <= 0) return "";
  if (display_cols(s) <= w) return s;
  return take_cols(s, w);
}

std::string hex8(uint64_t v) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%08llX", static_cast<unsigned long long>(v));
  return buf;
}

std::string hex2(uint8_t v) {
  static constexpr char digits[] = "0123456789ABCDEF";
  std::string s(2, '0');
  s[0] = digits[v >> 4];
  s[1] = digits[v & 0x0F];
  return s;
}

} // namespace binview::ui
