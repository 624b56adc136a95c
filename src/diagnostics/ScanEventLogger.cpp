#include "ScanEventLogger.h"

#include <iomanip>
#include <ostream>

namespace jpegicc::diagnostics {

namespace {

void writeEvent(std::ostream& stream, const codec::ScanEvent& event) {
  stream << "[scan] " << codec::scanEventKindName(event.kind)
         << " offset=" << event.offset << " marker=0x" << std::hex
         << std::setw(2) << std::setfill('0')
         << static_cast<int>(event.marker_type) << std::dec
         << std::setfill(' ');
  if (event.chunk_count > 0) {
    stream << " chunk=" << static_cast<int>(event.chunk_index) << "/"
           << static_cast<int>(event.chunk_count);
  }
  if (!event.detail.empty()) {
    stream << " " << event.detail;
  }
  stream << std::endl;
}

}  // namespace

ScanEventLogger::ScanEventLogger(std::ostream& out, std::ostream& err, bool verbose)
    : out_(out), err_(err), verbose_(verbose) {}

void ScanEventLogger::handle(const codec::ScanEvent& event) {
  std::lock_guard lock(mutex_);
  events_.push_back(event);
  if (event.isWarning()) {
    writeEvent(err_, event);
  } else if (verbose_) {
    writeEvent(out_, event);
  }
}

void ScanEventLogger::renderSummary() const {
  std::lock_guard lock(mutex_);
  std::size_t chunks = 0;
  std::size_t removed = 0;
  std::size_t skipped = 0;
  std::size_t warnings = 0;
  for (const auto& event : events_) {
    if (event.kind == codec::ScanEventKind::kChunkAccepted) {
      ++chunks;
    } else if (event.kind == codec::ScanEventKind::kSegmentRemoved) {
      ++removed;
    } else if (event.kind == codec::ScanEventKind::kSegmentSkipped) {
      ++skipped;
    }
    if (event.isWarning()) {
      ++warnings;
    }
  }
  out_ << "[scan] Summary chunks=" << chunks << " removed=" << removed
       << " skipped=" << skipped << " warnings=" << warnings << std::endl;
}

std::size_t ScanEventLogger::warningCount() const {
  std::lock_guard lock(mutex_);
  std::size_t warnings = 0;
  for (const auto& event : events_) {
    if (event.isWarning()) {
      ++warnings;
    }
  }
  return warnings;
}

std::size_t ScanEventLogger::eventCount() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

codec::ScanEventSink ScanEventLogger::sink() {
  return [this](const codec::ScanEvent& event) { handle(event); };
}

}  // namespace jpegicc::diagnostics
