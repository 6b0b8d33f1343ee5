#pragma once

#include "app/Navigator.hpp"
#include "model/Record.hpp"
#include "ui/Config.hpp"
#include "ui/LineCache.hpp"
#include "ui/Terminal.hpp"
#include <string>

namespace binview::app {

// One interactive session: draw, read one key, update, redraw in place.
class Viewer {
public:
  Viewer(const model::Dataset& data, ui::ITerminal& term,
         ui::Palette palette = ui::default_palette());

  // Run until the user confirms quit (true) or the terminal fails (false,
  // err set).
  [[nodiscard]] bool run(std::string& err);

  // Draw one frame, ending on the status line. line_feeds receives how many
  // rows the cursor moved down.
  [[nodiscard]] bool draw_frame(int& line_feeds, std::string& err);

  [[nodiscard]] const Navigator& navigator() const { return nav_; }
  [[nodiscard]] const ui::LineCache& cache() const { return cache_; }

private:
  int draw_records(std::string& frame, int height);
  void draw_status(std::string& frame, int width);

  const model::Dataset& data_;
  ui::ITerminal& term_;
  ui::Palette palette_;
  Navigator nav_;
  ui::LineCache cache_;
  ui::TermSize last_size_{};
};

} // namespace binview::app
