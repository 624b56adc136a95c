#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "codec/IccChunkDecoder.h"
#include "tests/support/JpegBuilders.h"

using namespace jpegicc::codec;
using namespace jpegicc::test_support;

namespace {

SegmentDescriptor segmentAt(const Bytes& buffer, std::size_t offset) {
  const auto step = SegmentReader(buffer).next(offset);
  EXPECT_EQ(step.kind, StepKind::kSegment);
  return step.segment;
}

std::string toString(ByteSpan data) {
  return std::string(data.begin(), data.end());
}

}  // namespace

TEST(IccChunkDecoderTests, DecodesHeaderAndData) {
  const auto buffer = jpeg({iccSegment(1, 1, "hi")});
  const auto segment = segmentAt(buffer, 2);

  EXPECT_TRUE(containsIccTag(buffer, segment));
  const auto result = decodeChunk(buffer, segment);
  ASSERT_EQ(result.status, ChunkStatus::kAccepted);
  EXPECT_EQ(result.chunk.header.chunk_index, 1);
  EXPECT_EQ(result.chunk.header.chunk_count, 1);
  EXPECT_EQ(result.chunk.segment_offset, 2u);
  EXPECT_EQ(toString(result.chunk.data), "hi");
}

TEST(IccChunkDecoderTests, AcceptsEmptyChunkData) {
  const auto buffer = jpeg({iccSegment(2, 3, "")});
  const auto result = decodeChunk(buffer, segmentAt(buffer, 2));
  ASSERT_EQ(result.status, ChunkStatus::kAccepted);
  EXPECT_EQ(result.chunk.header.chunk_index, 2);
  EXPECT_EQ(result.chunk.header.chunk_count, 3);
  EXPECT_TRUE(result.chunk.data.empty());
}

TEST(IccChunkDecoderTests, RejectsHeaderOutsideOneToCount) {
  const std::vector<std::pair<std::uint8_t, std::uint8_t>> headers{
      {0, 1}, {3, 2}, {0, 0}};
  for (const auto& [index, count] : headers) {
    const auto buffer = jpeg({iccSegment(index, count, "data")});
    const auto segment = segmentAt(buffer, 2);
    EXPECT_TRUE(containsIccTag(buffer, segment));
    const auto result = decodeChunk(buffer, segment);
    EXPECT_EQ(result.status, ChunkStatus::kInvalidHeader)
        << static_cast<int>(index) << "/" << static_cast<int>(count);
  }
}

TEST(IccChunkDecoderTests, IgnoresOtherTagsAndMarkers) {
  const auto mpf =
      jpeg({segment(0xE2, bytesOf("MPF payload that is long enough"))});
  EXPECT_EQ(decodeChunk(mpf, segmentAt(mpf, 2)).status, ChunkStatus::kNotIcc);

  const auto app1 = jpeg({segment(0xE1, iccPayload(1, 1, bytesOf("hi")))});
  const auto app1_segment = segmentAt(app1, 2);
  EXPECT_FALSE(containsIccTag(app1, app1_segment));
  EXPECT_EQ(decodeChunk(app1, app1_segment).status, ChunkStatus::kNotIcc);
}

TEST(IccChunkDecoderTests, RejectsSegmentTooShortForHeader) {
  // Full tag present but the declared length leaves no room for the count.
  Bytes payload = bytesOf("ICC_PROFILE");
  payload.push_back(0x00);
  payload.push_back(0x01);
  const auto buffer = jpeg({segment(0xE2, payload)});
  const auto segment_desc = segmentAt(buffer, 2);
  EXPECT_EQ(segment_desc.declared_length, 15);
  EXPECT_FALSE(containsIccTag(buffer, segment_desc));
  EXPECT_EQ(decodeChunk(buffer, segment_desc).status, ChunkStatus::kNotIcc);
}
