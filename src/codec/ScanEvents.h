#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "JpegMarkers.h"

namespace jpegicc::codec {

enum class ScanEventKind {
  kSegmentSkipped,
  kMalformedSegment,
  kTruncatedBuffer,
  kInvalidChunkHeader,
  kChunkAccepted,
  kProfileAssembled,
  kSegmentRemoved,
  kScanLimitReached
};

struct ScanEvent {
  ScanEventKind kind{ScanEventKind::kSegmentSkipped};
  std::size_t offset{};
  std::uint8_t marker_type{};
  std::uint8_t chunk_index{};
  std::uint8_t chunk_count{};
  std::string detail;

  [[nodiscard]] bool isWarning() const noexcept {
    return kind == ScanEventKind::kMalformedSegment ||
           kind == ScanEventKind::kTruncatedBuffer ||
           kind == ScanEventKind::kInvalidChunkHeader ||
           kind == ScanEventKind::kScanLimitReached;
  }
};

using ScanEventSink = std::function<void(const ScanEvent&)>;

struct ScanOptions {
  std::size_t segment_limit{kDefaultSegmentLimit};
  ScanEventSink sink;

  void emit(const ScanEvent& event) const {
    if (sink) {
      sink(event);
    }
  }
};

[[nodiscard]] std::string_view scanEventKindName(ScanEventKind kind) noexcept;

}  // namespace jpegicc::codec
