#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "ScanEvents.h"

namespace jpegicc::codec {

using ByteSpan = std::span<const std::uint8_t>;

struct SegmentDescriptor {
  std::uint8_t marker_type{};
  std::size_t offset{};
  // Empty for markers that carry no length field.
  std::optional<std::uint16_t> declared_length;
  std::size_t payload_start{};
  std::size_t payload_end{};

  [[nodiscard]] std::size_t end() const noexcept { return payload_end; }
  [[nodiscard]] std::size_t totalSize() const noexcept {
    return payload_end - offset;
  }
  [[nodiscard]] std::size_t payloadSize() const noexcept {
    return payload_end - payload_start;
  }
};

// kEndOfData: no further marker byte. kTruncated: a marker too close to the
// end of the buffer to carry a type or length.
enum class StepKind { kSegment, kMarkerOnly, kMalformed, kTruncated, kEndOfData };

struct ScanStep {
  StepKind kind{StepKind::kEndOfData};
  SegmentDescriptor segment;
  std::size_t next_offset{};
};

std::optional<std::size_t> locateNextMarker(ByteSpan buffer, std::size_t from);
std::optional<std::uint8_t> readType(ByteSpan buffer, std::size_t pos);
std::optional<std::uint16_t> readLength(ByteSpan buffer, std::size_t pos);

// RST0-RST7, SOI, EOI and TEM stand alone without a length field.
[[nodiscard]] bool hasLengthField(std::uint8_t marker_type) noexcept;

// Forwards malformed and truncated steps to the options' event sink.
void reportStep(const ScanStep& step, const ScanOptions& options);

// Walks a JPEG byte buffer one marker segment at a time. The reader never
// looks past the end of the buffer and every step that does not end the scan
// moves strictly forward.
class SegmentReader {
public:
  explicit SegmentReader(ByteSpan buffer);

  [[nodiscard]] ScanStep next(std::size_t from) const;
  [[nodiscard]] std::size_t size() const noexcept;

private:
  ByteSpan buffer_;
};

}  // namespace jpegicc::codec
