#include "ProfileAssembler.h"

#include <string>

namespace jpegicc::codec {

bool ProfileAssembler::add(const ChunkHeader& header, ByteSpan data) {
  chunks_[header.chunk_index].assign(data.begin(), data.end());
  expected_count_ = header.chunk_count;
  return complete();
}

bool ProfileAssembler::add(const IccChunk& chunk) {
  return add(chunk.header, chunk.data);
}

bool ProfileAssembler::complete() const noexcept {
  return expected_count_ != 0 && chunks_.size() == expected_count_;
}

std::size_t ProfileAssembler::size() const noexcept {
  return chunks_.size();
}

std::uint8_t ProfileAssembler::expectedCount() const noexcept {
  return expected_count_;
}

std::vector<std::uint8_t> ProfileAssembler::assemble() const {
  std::vector<std::uint8_t> profile;
  if (!complete()) {
    return profile;
  }
  std::size_t total = 0;
  for (const auto& [index, data] : chunks_) {
    total += data.size();
  }
  profile.reserve(total);
  for (const auto& [index, data] : chunks_) {
    profile.insert(profile.end(), data.begin(), data.end());
  }
  return profile;
}

void ProfileAssembler::reset() {
  chunks_.clear();
  expected_count_ = 0;
}

std::optional<std::vector<std::uint8_t>> extractProfile(
    ByteSpan buffer,
    const ScanOptions& options) {
  const SegmentReader reader(buffer);
  ProfileAssembler assembler;
  std::size_t pos = 0;
  std::size_t steps = 0;

  while (pos < buffer.size()) {
    if (steps >= options.segment_limit) {
      options.emit({ScanEventKind::kScanLimitReached, pos, 0, 0, 0,
                    "stopped after " + std::to_string(steps) + " segments"});
      break;
    }
    ++steps;

    const auto step = reader.next(pos);
    reportStep(step, options);
    if (step.kind == StepKind::kEndOfData || step.kind == StepKind::kTruncated) {
      break;
    }
    pos = step.next_offset;
    if (step.kind != StepKind::kSegment) {
      continue;
    }

    const auto decoded = decodeChunk(buffer, step.segment);
    if (decoded.status == ChunkStatus::kInvalidHeader) {
      const auto& header = decoded.chunk.header;
      options.emit({ScanEventKind::kInvalidChunkHeader, step.segment.offset,
                    step.segment.marker_type, header.chunk_index,
                    header.chunk_count, "chunk index outside 1..count"});
      continue;
    }
    if (decoded.status != ChunkStatus::kAccepted) {
      options.emit({ScanEventKind::kSegmentSkipped, step.segment.offset,
                    step.segment.marker_type, 0, 0, {}});
      continue;
    }

    const auto& header = decoded.chunk.header;
    options.emit({ScanEventKind::kChunkAccepted, step.segment.offset,
                  step.segment.marker_type, header.chunk_index,
                  header.chunk_count,
                  std::to_string(decoded.chunk.data.size()) + " bytes"});
    if (assembler.add(decoded.chunk)) {
      auto profile = assembler.assemble();
      options.emit({ScanEventKind::kProfileAssembled, step.segment.offset,
                    step.segment.marker_type, header.chunk_index,
                    header.chunk_count,
                    std::to_string(profile.size()) + " bytes"});
      return profile;
    }
  }
  return std::nullopt;
}

}  // namespace jpegicc::codec
