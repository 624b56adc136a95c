#pragma once

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <vector>

#include "codec/ScanEvents.h"

namespace jpegicc::diagnostics {

class ScanEventLogger {
public:
  ScanEventLogger(std::ostream& out, std::ostream& err, bool verbose = false);

  void handle(const codec::ScanEvent& event);
  void renderSummary() const;
  [[nodiscard]] std::size_t warningCount() const;
  [[nodiscard]] std::size_t eventCount() const;
  [[nodiscard]] codec::ScanEventSink sink();

private:
  std::ostream& out_;
  std::ostream& err_;
  bool verbose_;
  mutable std::mutex mutex_;
  std::vector<codec::ScanEvent> events_;
};

}  // namespace jpegicc::diagnostics
