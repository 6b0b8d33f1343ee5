#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

namespace binview::ui {

std::atomic<bool> g_stop{false};
std::atomic<int> g_out_fd{STDERR_FILENO};

void best_effort_write(int fd, const char* buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    buf += n;
    len -= static_cast<size_t>(n);
  }
}

void restore_terminal_minimal() {
  // Async-signal-safe restoration: reset SGR, then show cursor
  int fd = g_out_fd.load();
  best_effort_write(fd, kReset, std::char_traits<char>::length(kReset));
  best_effort_write(fd, kCursorOn, std::char_traits<char>::length(kCursorOn));
}

void on_sigint(int){ restore_terminal_minimal(); g_stop.store(true); }

void on_atexit_restore(){
  std::fflush(stderr);
  restore_terminal_minimal();
}

std::string sgr(std::string_view params) {
  std::string s("\x1B[");
  s += params;
  s += 'm';
  return s;
}

std::string cursor_up(int n) {
  return std::string("\x1B[") + std::to_string(n) + "A";
}

RawTermGuard::RawTermGuard(int fd) : fd_(fd) {
  if (::isatty(fd_) == 1 && tcgetattr(fd_, &old_) == 0) {
    termios neo = old_;
    neo.c_iflag &= ~(ISTRIP | INLCR | ICRNL | IGNCR | IXOFF);
    neo.c_lflag &= ~(ICANON | ECHO);
    neo.c_cc[VMIN] = 1;  // block for one key
    neo.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSANOW, &neo) == 0) active_ = true;
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) tcsetattr(fd_, TCSANOW, &old_);
}

CursorGuard::CursorGuard(int fd) : fd_(fd) {
  best_effort_write(fd_, kCursorOff, std::char_traits<char>::length(kCursorOff));
}

CursorGuard::~CursorGuard() {
  best_effort_write(fd_, kCursorOn, std::char_traits<char>::length(kCursorOn));
}

TtyTerminal::TtyTerminal(int out_fd) : out_fd_(out_fd) {}

TtyTerminal::~TtyTerminal() {
  raw_.reset();
  if (tty_fd_ >= 0) ::close(tty_fd_);
}

bool TtyTerminal::open(std::string& err) {
  tty_fd_ = ::open("/dev/tty", O_RDWR | O_CLOEXEC);
  if (tty_fd_ < 0) {
    err = std::string("/dev/tty: ") + std::strerror(errno);
    return false;
  }
  raw_ = std::make_unique<RawTermGuard>(tty_fd_);
  if (!raw_->active()) {
    err = "/dev/tty: cannot enter raw mode";
    return false;
  }
  return true;
}

bool TtyTerminal::size(TermSize& out, std::string& err) {
  struct winsize ws{};
  if (ioctl(tty_fd_, TIOCGWINSZ, &ws) != 0) {
    err = std::string("terminal size: ") + std::strerror(errno);
    return false;
  }
  out.cols = ws.ws_col;
  out.rows = ws.ws_row;
  return true;
}

bool read_key_fd(int fd, std::string& raw, std::string& err) {
  char buf[8];
  for (;;) {
    // A signal that landed outside read() would otherwise leave us blocked.
    if (g_stop.load()) {
      err = "interrupted";
      return false;
    }
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      raw.assign(buf, static_cast<size_t>(n));
      return true;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n == 0) err = "/dev/tty: end of input";
    else err = std::string("/dev/tty: ") + std::strerror(errno);
    return false;
  }
}

bool TtyTerminal::read_key(std::string& raw, std::string& err) {
  return read_key_fd(tty_fd_, raw, err);
}

void TtyTerminal::write(std::string_view bytes) {
  best_effort_write(out_fd_, bytes.data(), bytes.size());
}

} // namespace binview::ui
