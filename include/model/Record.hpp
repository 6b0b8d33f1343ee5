#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace binview::model {

// Bytes per displayed row.
inline constexpr size_t kRecordSize = 16;

// One row of input: up to kRecordSize bytes, immutable once loaded.
using Record = std::vector<uint8_t>;

// Whole input, materialized before the interactive loop starts.
using Dataset = std::vector<Record>;

[[nodiscard]] constexpr uint64_t record_address(size_t index) {
  return static_cast<uint64_t>(index) * kRecordSize;
}

} // namespace binview::model
