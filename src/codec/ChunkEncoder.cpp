#include "ChunkEncoder.h"

#include <algorithm>
#include <string>

#include "CodecError.h"
#include "JpegMarkers.h"

namespace jpegicc::codec {

std::size_t chunkCountFor(std::size_t profile_size) noexcept {
  return (profile_size + kMaxChunkPayload - 1) / kMaxChunkPayload;
}

ByteSpan chunkSlice(ByteSpan profile, std::size_t chunk_index) {
  const auto count = chunkCountFor(profile.size());
  if (chunk_index == 0 || chunk_index > count) {
    return {};
  }
  const auto from = (chunk_index - 1) * kMaxChunkPayload;
  const auto bytes = std::min(kMaxChunkPayload, profile.size() - from);
  return profile.subspan(from, bytes);
}

std::vector<std::uint8_t> encodeProfile(ByteSpan profile) {
  const auto count = chunkCountFor(profile.size());
  if (count > kMaxChunkCount) {
    throw CodecError(ErrorKind::kProfileTooLarge,
                     "profile of " + std::to_string(profile.size()) +
                         " bytes needs " + std::to_string(count) +
                         " chunks, at most 255 fit the chunk header");
  }

  std::vector<std::uint8_t> block;
  block.reserve(profile.size() +
                count * (kMarkerSize + kLengthFieldSize + kIccHeaderSize));

  for (std::size_t i = 1; i <= count; ++i) {
    const auto chunk = chunkSlice(profile, i);
    const auto segment_length = kLengthFieldSize + kIccHeaderSize + chunk.size();
    if (segment_length > kMaxSegmentLength) {
      throw CodecError(ErrorKind::kProfileTooLarge,
                       "segment length " + std::to_string(segment_length) +
                           " for chunk " + std::to_string(i) +
                           " exceeds the JPEG limit");
    }

    block.push_back(kMarkerPrefix);
    block.push_back(kMarkerApp2);
    block.push_back(static_cast<std::uint8_t>(segment_length >> 8));
    block.push_back(static_cast<std::uint8_t>(segment_length & 0xFF));
    block.insert(block.end(), kIccTag.begin(), kIccTag.end());
    block.push_back(static_cast<std::uint8_t>(i));
    block.push_back(static_cast<std::uint8_t>(count));
    block.insert(block.end(), chunk.begin(), chunk.end());
  }
  return block;
}

}  // namespace jpegicc::codec
