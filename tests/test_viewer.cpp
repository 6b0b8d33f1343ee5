#include "minitest.hpp"
#include "app/Viewer.hpp"
#include "ui/LineRenderer.hpp"
#include <deque>
#include <string>
#include <vector>

using namespace binview;
using binview::model::Dataset;
using binview::model::Record;

namespace {

// Terminal double: fixed (or scripted) size, queued keys, captured output.
class ScriptedTerminal final : public ui::ITerminal {
public:
  explicit ScriptedTerminal(ui::TermSize sz) : size_(sz) {}

  bool size(ui::TermSize& out, std::string& err) override {
    if (fail_size_) { err = "size failed"; return false; }
    if (!sizes_.empty()) { size_ = sizes_.front(); sizes_.pop_front(); }
    out = size_;
    return true;
  }

  bool read_key(std::string& raw, std::string& err) override {
    if (keys_.empty()) { err = "no more keys"; return false; }
    raw = keys_.front();
    keys_.pop_front();
    return true;
  }

  void write(std::string_view bytes) override { writes_.emplace_back(bytes); }

  void push_keys(std::initializer_list<const char*> keys) {
    for (const char* k : keys) keys_.emplace_back(k);
  }
  void push_size(ui::TermSize sz) { sizes_.push_back(sz); }
  void fail_size() { fail_size_ = true; }

  [[nodiscard]] std::string all() const {
    std::string s;
    for (const auto& w : writes_) s += w;
    return s;
  }
  [[nodiscard]] const std::vector<std::string>& writes() const { return writes_; }
  void clear_writes() { writes_.clear(); }

private:
  ui::TermSize size_;
  std::deque<ui::TermSize> sizes_;
  std::deque<std::string> keys_;
  std::vector<std::string> writes_;
  bool fail_size_{false};
};

Dataset rows(size_t n) {
  Dataset d;
  for (size_t i = 0; i < n; ++i) d.push_back(Record(16, static_cast<uint8_t>(i)));
  return d;
}

size_t count(const std::string& hay, const std::string& needle) {
  size_t n = 0;
  for (size_t p = hay.find(needle); p != std::string::npos; p = hay.find(needle, p + 1)) ++n;
  return n;
}

} // namespace

TEST(viewer_hello_world_first_frame) {
  Dataset d{Record{'H','e','l','l','o',' ','W','o','r','l','d'}};
  ScriptedTerminal term({80, 24});
  app::Viewer v(d, term);
  int lf = 0;
  std::string err;
  ASSERT_TRUE(v.draw_frame(lf, err));
  ASSERT_EQ(lf, 1);
  auto out = term.all();
  ASSERT_EQ(out.rfind(ui::kCursorOff, 0), 0u);
  auto row = ui::render_record(0, 0, d[0]);
  ASSERT_TRUE(out.find(row) != std::string::npos);
  ASSERT_TRUE(out.find("\x1B[0;40;37;1;7m48") != std::string::npos);
  ASSERT_TRUE(out.find("\x1B[0;40;37;1;7mH") != std::string::npos);
  ASSERT_TRUE(out.find("\x1B[0;33;1m(00000000):48\x1B[0m") != std::string::npos);
  ASSERT_EQ(out.substr(out.size() - 8), std::string(ui::kEraseScreenAfter));
}

TEST(viewer_second_identical_frame_writes_no_rows) {
  auto d = rows(5);
  ScriptedTerminal term({80, 24});
  app::Viewer v(d, term);
  int lf = 0;
  std::string err;
  ASSERT_TRUE(v.draw_frame(lf, err));
  ASSERT_EQ(lf, 5);
  ASSERT_EQ(v.cache().size(), 5u);
  term.clear_writes();
  ASSERT_TRUE(v.draw_frame(lf, err));
  ASSERT_EQ(lf, 5);
  auto out = term.all();
  ASSERT_EQ(out.find("00000000 "), std::string::npos);
  ASSERT_EQ(out.find(ui::kCursorOff), std::string::npos);
  // line feeds still walk past every row
  ASSERT_EQ(count(out, "\r\n"), 5u);
}

TEST(viewer_cursor_move_rewrites_only_affected_rows) {
  auto d = rows(5);
  ScriptedTerminal term({80, 24});
  term.push_keys({"j", "q", "y"});
  app::Viewer v(d, term);
  std::string err;
  ASSERT_TRUE(v.run(err));
  auto out = term.all();
  ASSERT_EQ(count(out, ui::render_record(0, 0, d[0])), 1u);
  ASSERT_EQ(count(out, ui::render_record(0, ui::kNoCursor, d[0])), 1u);
  ASSERT_EQ(count(out, ui::render_record(16, 0, d[1])), 1u);
  ASSERT_EQ(count(out, ui::render_record(32, ui::kNoCursor, d[2])), 1u);
  ASSERT_EQ(v.navigator().cursor().row, 1u);
}

TEST(viewer_moves_back_up_after_each_frame) {
  auto d = rows(5);
  ScriptedTerminal term({80, 24});
  term.push_keys({"q", "y"});
  app::Viewer v(d, term);
  std::string err;
  ASSERT_TRUE(v.run(err));
  const auto& w = term.writes();
  // frame, reposition, prompt frame, final newline
  ASSERT_EQ(w.size(), 4u);
  ASSERT_EQ(w[1], "\r\x1B[5A");
  ASSERT_TRUE(w[2].find(std::string("\x1B[0;33;1m") + app::kQuitPrompt + "\x1B[0m") != std::string::npos);
  ASSERT_EQ(w[3], "\n");
}

TEST(viewer_quit_declined_keeps_position) {
  auto d = rows(3);
  ScriptedTerminal term({80, 24});
  term.push_keys({"l", "l", "q", "n", "q", "y"});
  app::Viewer v(d, term);
  std::string err;
  ASSERT_TRUE(v.run(err));
  ASSERT_EQ(v.navigator().cursor().col, 2u);
  ASSERT_EQ(v.navigator().cursor().row, 0u);
  // the prompt was shown twice, the indicator came back in between
  ASSERT_EQ(count(term.all(), app::kQuitPrompt), 2u);
  ASSERT_TRUE(term.all().find("(00000002):00") != std::string::npos);
}

TEST(viewer_refresh_key_redraws_every_row) {
  auto d = rows(4);
  ScriptedTerminal term({80, 24});
  term.push_keys({"\x0C", "q", "y"});
  app::Viewer v(d, term);
  std::string err;
  ASSERT_TRUE(v.run(err));
  ASSERT_EQ(count(term.all(), ui::render_record(48, ui::kNoCursor, d[3])), 2u);
}

TEST(viewer_resize_clears_cache_and_hides_cursor_again) {
  auto d = rows(4);
  ScriptedTerminal term({80, 24});
  term.push_size({80, 24});
  term.push_size({100, 30});
  term.push_keys({"x", "q", "y"});
  app::Viewer v(d, term);
  std::string err;
  ASSERT_TRUE(v.run(err));
  auto out = term.all();
  ASSERT_EQ(count(out, ui::kCursorOff), 2u);
  ASSERT_EQ(count(out, ui::render_record(48, ui::kNoCursor, d[3])), 2u);
}

TEST(viewer_scrolls_to_keep_cursor_visible) {
  auto d = rows(10);
  ScriptedTerminal term({80, 4});
  term.push_keys({">"});
  app::Viewer v(d, term);
  std::string err;
  ASSERT_FALSE(v.run(err));
  ASSERT_EQ(err, "no more keys");
  ASSERT_EQ(v.navigator().viewport().height, 3u);
  ASSERT_EQ(v.navigator().viewport().start_row, 7u);
  auto last = term.writes().back();
  ASSERT_TRUE(last.find(ui::render_record(0x90, 0, d[9])) != std::string::npos);
  ASSERT_TRUE(last.find(ui::render_record(0x70, ui::kNoCursor, d[7])) != std::string::npos);
  ASSERT_EQ(last.find("00000060 "), std::string::npos);
  ASSERT_TRUE(last.find("(00000090):09") != std::string::npos);
}

TEST(viewer_status_is_truncated_to_width) {
  auto d = rows(1);
  ScriptedTerminal term({10, 24});
  term.push_keys({"q"});
  app::Viewer v(d, term);
  std::string err;
  ASSERT_FALSE(v.run(err));
  ASSERT_TRUE(term.all().find("\x1B[0;33;1mQuit Sure\x1B[0m") != std::string::npos);
}

TEST(viewer_single_row_terminal_still_shows_cursor_row) {
  auto d = rows(3);
  ScriptedTerminal term({80, 1});
  term.push_keys({"j", "j"});
  app::Viewer v(d, term);
  std::string err;
  ASSERT_FALSE(v.run(err));
  ASSERT_EQ(v.navigator().viewport().start_row, 2u);
  ASSERT_TRUE(term.writes().back().find("00000020 ") != std::string::npos);
}

TEST(viewer_size_failure_aborts) {
  auto d = rows(1);
  ScriptedTerminal term({80, 24});
  term.fail_size();
  app::Viewer v(d, term);
  std::string err;
  ASSERT_FALSE(v.run(err));
  ASSERT_EQ(err, "size failed");
  ASSERT_TRUE(term.writes().empty());
}

TEST(viewer_custom_palette_reaches_output) {
  auto d = rows(1);
  ScriptedTerminal term({80, 24});
  ui::Palette p{ui::sgr("7"), ui::sgr("31"), ui::sgr("32"), ui::sgr("36")};
  app::Viewer v(d, term, p);
  int lf = 0;
  std::string err;
  ASSERT_TRUE(v.draw_frame(lf, err));
  ASSERT_TRUE(term.all().find("\x1B[7m00") != std::string::npos);
  ASSERT_TRUE(term.all().find("\x1B[36m(00000000):00") != std::string::npos);
}
