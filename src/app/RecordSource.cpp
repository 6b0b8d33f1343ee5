#include "app/RecordSource.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace binview::app {

bool MemoryRecordSource::read(model::Record& out) {
  if (next_ >= data_.size()) return false;
  out = data_[next_++];
  return true;
}

bool append_records_from_fd(int fd, const std::string& label,
                            model::Dataset& out, model::Record& pending,
                            std::string& err) {
  unsigned char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      err = label + ": " + std::strerror(errno);
      return false;
    }
    if (n == 0) return true;
    for (ssize_t i = 0; i < n; ++i) {
      pending.push_back(buf[i]);
      if (pending.size() == model::kRecordSize) {
        out.push_back(std::move(pending));
        pending.clear();
      }
    }
  }
}

bool load_dataset(const std::vector<std::string>& paths,
                  model::Dataset& out, std::string& err) {
  out.clear();
  model::Record pending;
  pending.reserve(model::kRecordSize);

  std::vector<std::string> inputs = paths;
  if (inputs.empty()) inputs.emplace_back("-");

  for (const auto& p : inputs) {
    if (p == "-") {
      if (!append_records_from_fd(STDIN_FILENO, "<stdin>", out, pending, err)) return false;
      continue;
    }
    int fd = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
      err = p + ": " + std::strerror(errno);
      return false;
    }
    bool ok = append_records_from_fd(fd, p, out, pending, err);
    ::close(fd);
    if (!ok) return false;
  }
  if (!pending.empty()) out.push_back(std::move(pending));
  if (out.empty()) {
    err = "no input data (EOF)";
    return false;
  }
  return true;
}

} // namespace binview::app
