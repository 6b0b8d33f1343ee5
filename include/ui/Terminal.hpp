#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <termios.h>

namespace binview::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<int> g_out_fd;

void restore_terminal_minimal();
void on_sigint(int);
void on_atexit_restore();

// Control sequences
inline constexpr const char* kCursorOff = "\x1B[?25l";
inline constexpr const char* kCursorOn = "\x1B[?25h";
inline constexpr const char* kReset = "\x1B[0m";
inline constexpr const char* kEraseLine = "\x1B[0m\x1B[0K";
inline constexpr const char* kEraseScreenAfter = "\x1B[0m\x1B[0J";

// SGR code generation (unconditional, unlike a tty-gated color helper)
[[nodiscard]] std::string sgr(std::string_view params);
[[nodiscard]] std::string cursor_up(int n);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

// One blocking read(2) of up to 8 bytes. Fails with "interrupted" once g_stop
// is set, whether the signal arrived during the read or before it.
[[nodiscard]] bool read_key_fd(int fd, std::string& raw, std::string& err);

struct TermSize { int cols{0}; int rows{0}; };

// What the viewer loop needs from a terminal: its size, one key at a time,
// and somewhere to put bytes.
class ITerminal {
public:
  virtual ~ITerminal() = default;
  [[nodiscard]] virtual bool size(TermSize& out, std::string& err) = 0;
  // Block until one key event arrives; raw holds its bytes.
  [[nodiscard]] virtual bool read_key(std::string& raw, std::string& err) = 0;
  virtual void write(std::string_view bytes) = 0;
};

// RAII guard for the controlling tty's input mode
class RawTermGuard {
  bool active_{false};
  int fd_{-1};
  termios old_{};
public:
  explicit RawTermGuard(int fd);
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
  [[nodiscard]] bool active() const { return active_; }
};

// Hides the cursor for its lifetime.
class CursorGuard {
  int fd_;
public:
  explicit CursorGuard(int fd);
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

// Keys and size come from /dev/tty so data can arrive on stdin; frames go to
// out_fd.
class TtyTerminal final : public ITerminal {
public:
  explicit TtyTerminal(int out_fd);
  ~TtyTerminal() override;
  TtyTerminal(const TtyTerminal&) = delete;
  TtyTerminal& operator=(const TtyTerminal&) = delete;

  [[nodiscard]] bool open(std::string& err);
  [[nodiscard]] bool size(TermSize& out, std::string& err) override;
  [[nodiscard]] bool read_key(std::string& raw, std::string& err) override;
  void write(std::string_view bytes) override;

private:
  int out_fd_;
  int tty_fd_{-1};
  std::unique_ptr<RawTermGuard> raw_;
};

} // namespace binview::ui
