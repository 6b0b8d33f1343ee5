#include "ui/LineCache.hpp"

namespace binview::ui {

bool LineCache::should_write(int slot, const std::string& text) {
  auto it = lines_.find(slot);
  if (it != lines_.end() && it->second == text) return false;
  if (it == lines_.end()) lines_.emplace(slot, text);
  else it->second = text;
  return true;
}

} // namespace binview::ui
