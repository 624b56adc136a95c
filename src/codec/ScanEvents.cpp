#include "ScanEvents.h"

namespace jpegicc::codec {

std::string_view scanEventKindName(ScanEventKind kind) noexcept {
  switch (kind) {
    case ScanEventKind::kSegmentSkipped:
      return "skipped";
    case ScanEventKind::kMalformedSegment:
      return "malformed";
    case ScanEventKind::kTruncatedBuffer:
      return "truncated";
    case ScanEventKind::kInvalidChunkHeader:
      return "invalid-chunk-header";
    case ScanEventKind::kChunkAccepted:
      return "chunk";
    case ScanEventKind::kProfileAssembled:
      return "assembled";
    case ScanEventKind::kSegmentRemoved:
      return "removed";
    case ScanEventKind::kScanLimitReached:
      return "limit";
  }
  return "unknown";
}

}  // namespace jpegicc::codec
