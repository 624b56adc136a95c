#include "SegmentReader.h"

#include <algorithm>
#include <string>

#include "JpegMarkers.h"

namespace jpegicc::codec {

std::optional<std::size_t> locateNextMarker(ByteSpan buffer, std::size_t from) {
  if (from >= buffer.size()) {
    return std::nullopt;
  }
  const auto it = std::find(buffer.begin() + static_cast<std::ptrdiff_t>(from),
                            buffer.end(), kMarkerPrefix);
  if (it == buffer.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - buffer.begin());
}

std::optional<std::uint8_t> readType(ByteSpan buffer, std::size_t pos) {
  if (pos >= buffer.size() || buffer.size() - pos < kMarkerSize) {
    return std::nullopt;
  }
  return buffer[pos + 1];
}

std::optional<std::uint16_t> readLength(ByteSpan buffer, std::size_t pos) {
  if (pos >= buffer.size() ||
      buffer.size() - pos < kMarkerSize + kLengthFieldSize) {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>((buffer[pos + 2] << 8) | buffer[pos + 3]);
}

bool hasLengthField(std::uint8_t marker_type) noexcept {
  if (marker_type >= kMarkerRst0 && marker_type <= kMarkerEoi) {
    return false;
  }
  return marker_type != kMarkerTem;
}

void reportStep(const ScanStep& step, const ScanOptions& options) {
  if (step.kind != StepKind::kMalformed && step.kind != StepKind::kTruncated) {
    return;
  }
  ScanEvent event;
  event.offset = step.segment.offset;
  event.marker_type = step.segment.marker_type;
  if (step.kind == StepKind::kMalformed) {
    event.kind = ScanEventKind::kMalformedSegment;
    event.detail = "declared length " +
                   std::to_string(step.segment.declared_length.value_or(0)) +
                   " does not fit the buffer";
  } else {
    event.kind = ScanEventKind::kTruncatedBuffer;
    event.detail = "marker header cut off by end of buffer";
  }
  options.emit(event);
}

SegmentReader::SegmentReader(ByteSpan buffer) : buffer_(buffer) {}

std::size_t SegmentReader::size() const noexcept {
  return buffer_.size();
}

ScanStep SegmentReader::next(std::size_t from) const {
  ScanStep step;
  const auto marker = locateNextMarker(buffer_, from);
  if (!marker) {
    return step;
  }

  const auto pos = *marker;
  step.segment.offset = pos;
  const auto type = readType(buffer_, pos);
  if (!type) {
    step.kind = StepKind::kTruncated;
    return step;
  }

  step.segment.marker_type = *type;
  step.segment.payload_start = pos + kMarkerSize;
  step.segment.payload_end = pos + kMarkerSize;
  step.next_offset = pos + kMarkerSize;

  if (!hasLengthField(*type)) {
    step.kind = StepKind::kMarkerOnly;
    return step;
  }

  const auto length = readLength(buffer_, pos);
  if (!length) {
    // Not even room for a length field; nothing after this can be a segment.
    step.kind = StepKind::kTruncated;
    return step;
  }

  step.segment.declared_length = *length;
  const auto end = pos + kMarkerSize + *length;
  if (*length < kLengthFieldSize || end > buffer_.size()) {
    step.kind = StepKind::kMalformed;
    return step;
  }

  step.kind = StepKind::kSegment;
  step.segment.payload_start = pos + kMarkerSize + kLengthFieldSize;
  step.segment.payload_end = end;
  step.next_offset = end;
  return step;
}

}  // namespace jpegicc::codec
