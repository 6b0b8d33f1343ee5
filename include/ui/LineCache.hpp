#pragma once

#include <string>
#include <unordered_map>

namespace binview::ui {

// Last text written to each visible row slot, so unchanged rows are skipped.
// One cache per viewer session; cleared on resize or explicit refresh.
class LineCache {
public:
  // True when text differs from what the slot last showed; the memo is
  // updated in that case.
  [[nodiscard]] bool should_write(int slot, const std::string& text);
  void clear() { lines_.clear(); }
  [[nodiscard]] size_t size() const { return lines_.size(); }

private:
  std::unordered_map<int, std::string> lines_;
};

} // namespace binview::ui
