#include <gtest/gtest.h>

#include <sstream>

#include "diagnostics/ScanEventLogger.h"

using jpegicc::codec::ScanEvent;
using jpegicc::codec::ScanEventKind;
using jpegicc::diagnostics::ScanEventLogger;

TEST(ScanEventLoggerTests, WarningsAlwaysReachErrorStream) {
  std::ostringstream out;
  std::ostringstream err;
  ScanEventLogger logger(out, err);

  logger.handle({ScanEventKind::kChunkAccepted, 2, 0xE2, 1, 1, "2 bytes"});
  logger.handle({ScanEventKind::kMalformedSegment, 20, 0xE1, 0, 0, "bad"});

  EXPECT_TRUE(out.str().empty());
  EXPECT_NE(err.str().find("[scan] malformed offset=20 marker=0xe1 bad"),
            std::string::npos)
      << err.str();
  EXPECT_EQ(logger.warningCount(), 1u);
  EXPECT_EQ(logger.eventCount(), 2u);
}

TEST(ScanEventLoggerTests, VerboseLoggerPrintsEveryEvent) {
  std::ostringstream out;
  std::ostringstream err;
  ScanEventLogger logger(out, err, true);
  const auto sink = logger.sink();

  sink({ScanEventKind::kChunkAccepted, 2, 0xE2, 1, 3, "10 bytes"});
  sink({ScanEventKind::kSegmentRemoved, 40, 0xE2, 0, 0, "28 bytes"});
  logger.renderSummary();

  const auto text = out.str();
  EXPECT_NE(text.find("[scan] chunk offset=2 marker=0xe2 chunk=1/3 10 bytes"),
            std::string::npos)
      << text;
  EXPECT_NE(text.find("[scan] removed offset=40"), std::string::npos);
  EXPECT_NE(text.find("Summary chunks=1 removed=1 skipped=0 warnings=0"),
            std::string::npos)
      << text;
  EXPECT_TRUE(err.str().empty());
}
