#pragma once
#include "model/Record.hpp"
#include <string>
#include <vector>

namespace binview::app {

// Forward-only view over fixed-size records. The renderer only needs
// read() and the index of the first record it is about to see.
class IRecordSource {
public:
  virtual ~IRecordSource() = default;

  // Copy the next record into out. Return false at end of stream.
  [[nodiscard]] virtual bool read(model::Record& out) = 0;

  // Index of the next record read() will return.
  [[nodiscard]] virtual size_t home_address() const = 0;
};

// Window over an in-memory dataset starting at start_row.
class MemoryRecordSource final : public IRecordSource {
public:
  MemoryRecordSource(const model::Dataset& data, size_t start_row)
      : data_(data), next_(start_row) {}

  [[nodiscard]] bool read(model::Record& out) override;
  [[nodiscard]] size_t home_address() const override { return next_; }

private:
  const model::Dataset& data_;
  size_t next_;
};

// Chunk a byte stream read from fd into records. Returns false and sets err
// on any read error other than end of stream.
[[nodiscard]] bool append_records_from_fd(int fd, const std::string& label,
                                          model::Dataset& out, model::Record& pending,
                                          std::string& err);

// Read every path in order ("-" or an empty list means stdin) into out.
// An empty result is an error.
[[nodiscard]] bool load_dataset(const std::vector<std::string>& paths,
                                model::Dataset& out, std::string& err);

} // namespace binview::app
