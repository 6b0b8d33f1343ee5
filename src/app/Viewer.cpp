#include "app/Viewer.hpp"
#include "app/RecordSource.hpp"
#include "ui/Formatting.hpp"
#include "ui/LineRenderer.hpp"
#include <algorithm>
#include <utility>

namespace binview::app {

Viewer::Viewer(const model::Dataset& data, ui::ITerminal& term, ui::Palette palette)
    : data_(data), term_(term), palette_(std::move(palette)), nav_(data) {}

int Viewer::draw_records(std::string& frame, int height) {
  MemoryRecordSource window(data_, nav_.viewport().start_row);
  const size_t home = window.home_address();
  const size_t cursor_slot = nav_.cursor().row - nav_.viewport().start_row;
  int line_feeds = 0;
  model::Record rec;
  for (int count = 0; count < height && window.read(rec); ++count) {
    if (count > 0) {
      frame += "\r\n";
      line_feeds++;
    }
    int cursor_col = ((size_t)count == cursor_slot) ? (int)nav_.cursor().col : ui::kNoCursor;
    std::string line = ui::render_record(model::record_address(home + (size_t)count),
                                         cursor_col, rec, palette_);
    if (cache_.should_write(count, line)) frame += line;
  }
  return line_feeds;
}

void Viewer::draw_status(std::string& frame, int width) {
  std::string message = nav_.mode() == Mode::ConfirmQuit ? nav_.message() : nav_.take_message();
  if (!message.empty()) {
    frame += palette_.status;
    frame += ui::truncate_cols(message, width);
    frame += ui::kReset;
    return;
  }
  const auto& cur = nav_.cursor();
  if (cur.row < data_.size() && cur.col < data_[cur.row].size()) {
    frame += palette_.status;
    frame += "(" + ui::hex8(model::record_address(cur.row) + cur.col) + "):";
    frame += ui::hex2(data_[cur.row][cur.col]);
    frame += ui::kReset;
  }
}

bool Viewer::draw_frame(int& line_feeds, std::string& err) {
  ui::TermSize sz{};
  if (!term_.size(sz, err)) return false;
  std::string frame;
  if (sz.cols != last_size_.cols || sz.rows != last_size_.rows) {
    cache_.clear();
    last_size_ = sz;
    frame += ui::kCursorOff;
  }
  // Last row is the status line.
  const int height = std::max(1, sz.rows - 1);
  nav_.set_page_height((size_t)height);

  line_feeds = draw_records(frame, height);
  frame += "\r\n";
  line_feeds++;
  draw_status(frame, sz.cols - 1);
  frame += ui::kEraseScreenAfter;
  term_.write(frame);
  return true;
}

bool Viewer::run(std::string& err) {
  for (;;) {
    if (ui::g_stop.load()) {
      err = "interrupted";
      return false;
    }
    int line_feeds = 0;
    if (!draw_frame(line_feeds, err)) return false;

    std::string raw;
    if (!term_.read_key(raw, err)) return false;
    switch (nav_.dispatch(ui::decode_key(raw))) {
      case Outcome::Quit:
        term_.write("\n");
        return true;
      case Outcome::Redraw:
        cache_.clear();
        break;
      case Outcome::None:
        break;
    }
    // Move back to the first row so the next frame overdraws this one.
    if (line_feeds > 0) term_.write("\r" + ui::cursor_up(line_feeds));
    else term_.write("\r");
  }
}

} // namespace binview::app
