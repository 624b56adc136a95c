#include <gtest/gtest.h>

#include "codec/ChunkEncoder.h"
#include "codec/CodecError.h"
#include "codec/JpegMarkers.h"
#include "codec/ProfileAssembler.h"
#include "tests/support/JpegBuilders.h"

using namespace jpegicc::codec;
using namespace jpegicc::test_support;

namespace {

std::size_t segmentLengthAt(const Bytes& block, std::size_t offset) {
  return (static_cast<std::size_t>(block[offset + 2]) << 8) | block[offset + 3];
}

Bytes roundTrip(const Bytes& profile) {
  const auto block = encodeProfile(profile);
  Bytes buffer = soi();
  buffer.insert(buffer.end(), block.begin(), block.end());
  const auto tail = eoi();
  buffer.insert(buffer.end(), tail.begin(), tail.end());
  return extractProfile(buffer).value_or(Bytes{});
}

}  // namespace

TEST(ChunkEncoderTests, ChunkCountUsesMaximumPayload) {
  EXPECT_EQ(kMaxChunkPayload, 65519u);
  EXPECT_EQ(chunkCountFor(0), 0u);
  EXPECT_EQ(chunkCountFor(1), 1u);
  EXPECT_EQ(chunkCountFor(65519), 1u);
  EXPECT_EQ(chunkCountFor(65520), 2u);
  EXPECT_EQ(chunkCountFor(3 * 65519), 3u);
}

TEST(ChunkEncoderTests, SlicesLastChunkToRemainder) {
  const auto profile = patternedProfile(65519 + 10);
  EXPECT_EQ(chunkSlice(profile, 1).size(), 65519u);
  EXPECT_EQ(chunkSlice(profile, 2).size(), 10u);
  EXPECT_EQ(chunkSlice(profile, 2).front(), profile[65519]);
  EXPECT_TRUE(chunkSlice(profile, 0).empty());
  EXPECT_TRUE(chunkSlice(profile, 3).empty());
}

TEST(ChunkEncoderTests, EncodesSingleChunkByteExact) {
  const auto block = encodeProfile(bytesOf("hi"));
  EXPECT_EQ(block, iccSegment(1, 1, "hi"));
  EXPECT_EQ(block.size(), 20u);
  EXPECT_EQ(segmentLengthAt(block, 0), 18u);
}

TEST(ChunkEncoderTests, EmptyProfileEncodesToNothing) {
  EXPECT_TRUE(encodeProfile(Bytes{}).empty());
}

TEST(ChunkEncoderTests, SplitsAcrossSegmentsAtMaximumPayload) {
  const auto profile = patternedProfile(65520);
  const auto block = encodeProfile(profile);

  ASSERT_EQ(block.size(), 65520u + 2 * 18);
  EXPECT_EQ(block[0], 0xFF);
  EXPECT_EQ(block[1], 0xE2);
  EXPECT_EQ(segmentLengthAt(block, 0), kMaxSegmentLength);
  EXPECT_EQ(block[16], 1);
  EXPECT_EQ(block[17], 2);

  const auto second = 2 + kMaxSegmentLength;
  EXPECT_EQ(block[second], 0xFF);
  EXPECT_EQ(block[second + 1], 0xE2);
  EXPECT_EQ(segmentLengthAt(block, second), 17u);
  EXPECT_EQ(block[second + 16], 2);
  EXPECT_EQ(block[second + 17], 2);
  EXPECT_EQ(block.back(), profile.back());
}

TEST(ChunkEncoderTests, EncodingIsDeterministic) {
  const auto profile = patternedProfile(70000, 7);
  EXPECT_EQ(encodeProfile(profile), encodeProfile(profile));
}

TEST(ChunkEncoderTests, RoundTripsBoundaryLengths) {
  for (const std::size_t size : {0u, 1u, 65519u, 65520u}) {
    const auto profile = patternedProfile(size, 3);
    EXPECT_EQ(roundTrip(profile), profile) << "size=" << size;
  }
}

TEST(ChunkEncoderTests, RejectsProfileNeedingMoreThan255Chunks) {
  const Bytes profile(kMaxChunkPayload * kMaxChunkCount + 1, 0x42);
  try {
    (void)encodeProfile(profile);
    FAIL() << "expected CodecError";
  } catch (const CodecError& error) {
    EXPECT_EQ(error.kind(), ErrorKind::kProfileTooLarge);
    EXPECT_EQ(errorKindName(error.kind()), "ProfileTooLarge");
  }
}
