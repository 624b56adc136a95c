#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "SegmentReader.h"

namespace jpegicc::codec {

// Number of APP2 segments needed to carry a profile of `profile_size` bytes.
[[nodiscard]] std::size_t chunkCountFor(std::size_t profile_size) noexcept;

// Data slice of 1-based chunk `chunk_index`; empty when out of range.
[[nodiscard]] ByteSpan chunkSlice(ByteSpan profile, std::size_t chunk_index);

// Frames the profile as consecutive APP2 segments, chunk 1 first. An empty
// profile encodes to an empty block. Throws CodecError(kProfileTooLarge) when
// a segment length or the chunk count would not fit its field.
std::vector<std::uint8_t> encodeProfile(ByteSpan profile);

}  // namespace jpegicc::codec
