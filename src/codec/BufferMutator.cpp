#include "BufferMutator.h"

#include <string>

#include "ChunkEncoder.h"
#include "CodecError.h"
#include "IccChunkDecoder.h"
#include "JpegMarkers.h"

namespace jpegicc::codec {

namespace {

void requireSoi(ByteSpan buffer) {
  if (!startsWithSoi(buffer)) {
    throw CodecError(ErrorKind::kInvalidContainer,
                     "buffer does not start with the JPEG SOI marker");
  }
}

void spliceAfterSoi(std::vector<std::uint8_t>& buffer,
                    const std::vector<std::uint8_t>& block) {
  if (block.empty()) {
    return;
  }
  buffer.insert(buffer.begin() + static_cast<std::ptrdiff_t>(kMarkerSize),
                block.begin(), block.end());
}

}  // namespace

bool startsWithSoi(ByteSpan buffer) noexcept {
  return buffer.size() >= kMarkerSize && buffer[0] == kMarkerPrefix &&
         buffer[1] == kMarkerSoi;
}

std::size_t removeProfileSegments(std::vector<std::uint8_t>& buffer,
                                  const ScanOptions& options) {
  std::size_t removed = 0;
  std::size_t pos = 0;
  std::size_t steps = 0;

  while (pos < buffer.size()) {
    if (steps >= options.segment_limit) {
      options.emit({ScanEventKind::kScanLimitReached, pos, 0, 0, 0,
                    "stopped after " + std::to_string(steps) + " segments"});
      break;
    }
    ++steps;

    // The reader is rebuilt each step because erasing invalidates the span.
    const SegmentReader reader(buffer);
    const auto step = reader.next(pos);
    reportStep(step, options);
    if (step.kind == StepKind::kEndOfData || step.kind == StepKind::kTruncated) {
      break;
    }

    if (step.kind == StepKind::kSegment && containsIccTag(buffer, step.segment)) {
      const auto& segment = step.segment;
      options.emit({ScanEventKind::kSegmentRemoved, segment.offset,
                    segment.marker_type, 0, 0,
                    std::to_string(segment.totalSize()) + " bytes"});
      const auto first = buffer.begin() + static_cast<std::ptrdiff_t>(segment.offset);
      buffer.erase(first, first + static_cast<std::ptrdiff_t>(segment.totalSize()));
      ++removed;
      // Following bytes shifted left; rescan from the same offset.
      pos = segment.offset;
      continue;
    }
    pos = step.next_offset;
  }
  return removed;
}

void insertProfileSegments(std::vector<std::uint8_t>& buffer, ByteSpan profile) {
  requireSoi(buffer);
  const auto block = encodeProfile(profile);
  spliceAfterSoi(buffer, block);
}

std::size_t replaceProfileSegments(std::vector<std::uint8_t>& buffer,
                                   ByteSpan profile,
                                   const ScanOptions& options) {
  requireSoi(buffer);
  const auto block = encodeProfile(profile);
  const auto removed = removeProfileSegments(buffer, options);
  // Removal never touches SOI itself, so the check above still holds.
  spliceAfterSoi(buffer, block);
  return removed;
}

}  // namespace jpegicc::codec
