#include "app/Navigator.hpp"
#include <algorithm>

namespace binview::app {

using ui::KeyToken;

struct Binding { KeyToken token; char ch; Action action; };

static constexpr Binding kBindings[] = {
  {KeyToken::Down,   0,   Action::Down},
  {KeyToken::CtrlN,  0,   Action::Down},
  {KeyToken::Char,   'j', Action::Down},
  {KeyToken::Up,     0,   Action::Up},
  {KeyToken::CtrlP,  0,   Action::Up},
  {KeyToken::Char,   'k', Action::Up},
  {KeyToken::Left,   0,   Action::Left},
  {KeyToken::CtrlB,  0,   Action::Left},
  {KeyToken::Char,   'h', Action::Left},
  {KeyToken::Right,  0,   Action::Right},
  {KeyToken::CtrlF,  0,   Action::Right},
  {KeyToken::Char,   'l', Action::Right},
  {KeyToken::Char,   '0', Action::LineStart},
  {KeyToken::Char,   '^', Action::LineStart},
  {KeyToken::CtrlA,  0,   Action::LineStart},
  {KeyToken::Char,   '$', Action::LineEnd},
  {KeyToken::CtrlE,  0,   Action::LineEnd},
  {KeyToken::Char,   '<', Action::Top},
  {KeyToken::Char,   '>', Action::Bottom},
  {KeyToken::CtrlL,  0,   Action::Refresh},
  {KeyToken::Char,   'q', Action::Quit},
  {KeyToken::Escape, 0,   Action::Quit},
};

Action action_for(const ui::KeyEvent& key) {
  for (const auto& b : kBindings) {
    if (b.token != key.token) continue;
    if (b.token == KeyToken::Char && b.ch != key.ch) continue;
    return b.action;
  }
  return Action::None;
}

Navigator::Navigator(const model::Dataset& data, size_t page_height)
    : data_(data) {
  viewport_.height = std::max<size_t>(1, page_height);
}

size_t Navigator::last_row() const {
  return data_.empty() ? 0 : data_.size() - 1;
}

size_t Navigator::last_col() const {
  if (cursor_.row >= data_.size() || data_[cursor_.row].empty()) return 0;
  return data_[cursor_.row].size() - 1;
}

void Navigator::set_page_height(size_t height) {
  viewport_.height = std::max<size_t>(1, height);
  clamp_and_scroll();
}

std::string Navigator::take_message() {
  std::string m;
  m.swap(message_);
  return m;
}

Outcome Navigator::dispatch(const ui::KeyEvent& key) {
  if (mode_ == Mode::ConfirmQuit) {
    mode_ = Mode::Normal;
    message_.clear();
    if (key.token == KeyToken::Char && key.ch == 'y') return Outcome::Quit;
    return Outcome::None;
  }
  Outcome out = apply(action_for(key));
  clamp_and_scroll();
  return out;
}

Outcome Navigator::apply(Action a) {
  switch (a) {
    case Action::Down:
      if (cursor_.row < last_row()) cursor_.row++;
      break;
    case Action::Up:
      if (cursor_.row > 0) cursor_.row--;
      break;
    case Action::Left:
      if (cursor_.col > 0) cursor_.col--;
      break;
    case Action::Right:
      cursor_.col++;
      break;
    case Action::LineStart:
      cursor_.col = 0;
      break;
    case Action::LineEnd:
      cursor_.col = last_col();
      break;
    case Action::Top:
      cursor_.row = 0;
      break;
    case Action::Bottom:
      cursor_.row = last_row();
      break;
    case Action::Refresh:
      return Outcome::Redraw;
    case Action::Quit:
      mode_ = Mode::ConfirmQuit;
      message_ = kQuitPrompt;
      break;
    case Action::None:
      break;
  }
  return Outcome::None;
}

void Navigator::clamp_and_scroll() {
  cursor_.row = std::min(cursor_.row, last_row());
  cursor_.col = std::min(cursor_.col, last_col());
  if (cursor_.row < viewport_.start_row) {
    viewport_.start_row = cursor_.row;
  } else if (cursor_.row >= viewport_.start_row + viewport_.height) {
    viewport_.start_row = cursor_.row - viewport_.height + 1;
  }
}

} // namespace binview::app
