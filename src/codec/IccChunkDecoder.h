#pragma once

#include <cstdint>

#include "SegmentReader.h"

namespace jpegicc::codec {

struct ChunkHeader {
  std::uint8_t chunk_index{};  // 1-based
  std::uint8_t chunk_count{};

  [[nodiscard]] bool isValid() const noexcept {
    return chunk_index >= 1 && chunk_index <= chunk_count;
  }
};

struct IccChunk {
  ChunkHeader header;
  ByteSpan data;
  std::size_t segment_offset{};
};

enum class ChunkStatus { kNotIcc, kInvalidHeader, kAccepted };

struct ChunkDecodeResult {
  ChunkStatus status{ChunkStatus::kNotIcc};
  IccChunk chunk;
};

// True when the segment is an APP2 segment large enough for the ICC header
// and its payload starts with the ICC tag. The chunk header is not checked.
[[nodiscard]] bool containsIccTag(ByteSpan buffer,
                                  const SegmentDescriptor& segment) noexcept;

// Decodes the chunk header and data slice of an ICC-tagged APP2 segment. The
// returned data span aliases `buffer`.
[[nodiscard]] ChunkDecodeResult decodeChunk(ByteSpan buffer,
                                            const SegmentDescriptor& segment);

}  // namespace jpegicc::codec
