#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "ScanEvents.h"
#include "SegmentReader.h"

namespace jpegicc::codec {

[[nodiscard]] bool startsWithSoi(ByteSpan buffer) noexcept;

// Erases every ICC-tagged APP2 segment in place. Returns the number of
// segments removed; zero is not an error.
std::size_t removeProfileSegments(std::vector<std::uint8_t>& buffer,
                                  const ScanOptions& options = {});

// Splices the encoded profile right after SOI. An empty profile is a no-op.
// Throws CodecError (kInvalidContainer, kProfileTooLarge) before touching
// the buffer.
void insertProfileSegments(std::vector<std::uint8_t>& buffer, ByteSpan profile);

// Removal followed by insertion, leaving exactly one embedded profile. All
// validation happens before the first byte is changed. Returns the number
// of segments removed.
std::size_t replaceProfileSegments(std::vector<std::uint8_t>& buffer,
                                   ByteSpan profile,
                                   const ScanOptions& options = {});

}  // namespace jpegicc::codec
