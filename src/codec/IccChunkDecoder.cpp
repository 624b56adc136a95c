#include "IccChunkDecoder.h"

#include <algorithm>

#include "JpegMarkers.h"

namespace jpegicc::codec {

bool containsIccTag(ByteSpan buffer, const SegmentDescriptor& segment) noexcept {
  if (segment.marker_type != kMarkerApp2 || !segment.declared_length) {
    return false;
  }
  if (*segment.declared_length < kLengthFieldSize + kIccHeaderSize) {
    return false;
  }
  const auto tag_start = segment.offset + kMarkerSize + kLengthFieldSize;
  if (tag_start + kIccHeaderSize > buffer.size()) {
    return false;
  }
  return std::equal(kIccTag.begin(), kIccTag.end(),
                    buffer.begin() + static_cast<std::ptrdiff_t>(tag_start));
}

ChunkDecodeResult decodeChunk(ByteSpan buffer, const SegmentDescriptor& segment) {
  ChunkDecodeResult result;
  if (!containsIccTag(buffer, segment)) {
    return result;
  }

  const auto header_pos =
      segment.offset + kMarkerSize + kLengthFieldSize + kIccTag.size();
  result.chunk.segment_offset = segment.offset;
  result.chunk.header.chunk_index = buffer[header_pos];
  result.chunk.header.chunk_count = buffer[header_pos + 1];
  if (!result.chunk.header.isValid()) {
    result.status = ChunkStatus::kInvalidHeader;
    return result;
  }

  const auto data_start = header_pos + 2;
  const auto data_size =
      static_cast<std::size_t>(*segment.declared_length) - kLengthFieldSize -
      kIccHeaderSize;
  if (data_start + data_size > buffer.size()) {
    return result;
  }

  result.status = ChunkStatus::kAccepted;
  result.chunk.data = buffer.subspan(data_start, data_size);
  return result;
}

}  // namespace jpegicc::codec
