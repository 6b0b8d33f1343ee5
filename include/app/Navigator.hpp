#pragma once

#include "model/Record.hpp"
#include "ui/Keys.hpp"
#include <cstddef>
#include <string>

namespace binview::app {

enum class Mode { Normal, ConfirmQuit };

enum class Action {
  None,
  Down, Up, Left, Right,
  LineStart, LineEnd,
  Top, Bottom,
  Refresh,
  Quit,
};

// What the caller must do after a key was handled.
enum class Outcome { None, Redraw, Quit };

// Normal-mode key binding table lookup.
[[nodiscard]] Action action_for(const ui::KeyEvent& key);

struct CursorPosition {
  size_t row{0};
  size_t col{0};
};

struct Viewport {
  size_t start_row{0};
  size_t height{1};
};

inline constexpr const char* kQuitPrompt = "Quit Sure ? [y/n]";

// Cursor, viewport and quit confirmation over a non-empty dataset.
// Every transition re-clamps the column to the (possibly new) row first,
// then scrolls the viewport so the cursor row stays visible.
class Navigator {
public:
  explicit Navigator(const model::Dataset& data, size_t page_height = 1);

  Outcome dispatch(const ui::KeyEvent& key);

  // Rows available for records; at least 1.
  void set_page_height(size_t height);

  [[nodiscard]] const CursorPosition& cursor() const { return cursor_; }
  [[nodiscard]] const Viewport& viewport() const { return viewport_; }
  [[nodiscard]] Mode mode() const { return mode_; }

  // Transient status text; empty when the byte indicator should show.
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] std::string take_message();

private:
  Outcome apply(Action a);
  void clamp_and_scroll();
  [[nodiscard]] size_t last_row() const;
  [[nodiscard]] size_t last_col() const;

  const model::Dataset& data_;
  CursorPosition cursor_{};
  Viewport viewport_{};
  Mode mode_{Mode::Normal};
  std::string message_;
};

} // namespace binview::app
