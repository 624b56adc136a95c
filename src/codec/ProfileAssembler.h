#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "IccChunkDecoder.h"
#include "ScanEvents.h"
#include "SegmentReader.h"

namespace jpegicc::codec {

class ProfileAssembler {
public:
  // Stores the chunk, replacing any earlier chunk with the same index, and
  // reports whether the collected set is now complete.
  bool add(const ChunkHeader& header, ByteSpan data);
  bool add(const IccChunk& chunk);

  [[nodiscard]] bool complete() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] std::uint8_t expectedCount() const noexcept;

  // Concatenates the stored chunks in index order. Empty unless complete().
  [[nodiscard]] std::vector<std::uint8_t> assemble() const;
  void reset();

private:
  std::map<std::uint8_t, std::vector<std::uint8_t>> chunks_;
  std::uint8_t expected_count_{0};
};

// Scans a whole JPEG buffer left to right and returns the first profile
// whose chunks are all present. Segments after the completing chunk are not
// inspected.
std::optional<std::vector<std::uint8_t>> extractProfile(
    ByteSpan buffer,
    const ScanOptions& options = {});

}  // namespace jpegicc::codec
