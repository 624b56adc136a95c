#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace jpegicc::codec {

constexpr std::uint8_t kMarkerPrefix = 0xFF;
constexpr std::uint8_t kMarkerSoi = 0xD8;
constexpr std::uint8_t kMarkerEoi = 0xD9;
constexpr std::uint8_t kMarkerRst0 = 0xD0;
constexpr std::uint8_t kMarkerTem = 0x01;
constexpr std::uint8_t kMarkerApp2 = 0xE2;

// Marker byte + type byte.
constexpr std::size_t kMarkerSize = 2;
// The big-endian length field counts itself.
constexpr std::size_t kLengthFieldSize = 2;
constexpr std::size_t kMaxSegmentLength = 65535;
constexpr std::size_t kMaxSegmentPayload = kMaxSegmentLength - kLengthFieldSize;

// "ICC_PROFILE" plus a terminating zero byte.
constexpr std::array<std::uint8_t, 12> kIccTag = {
    'I', 'C', 'C', '_', 'P', 'R', 'O', 'F', 'I', 'L', 'E', 0x00};
constexpr std::size_t kIccHeaderSize = kIccTag.size() + 2;
constexpr std::size_t kMaxChunkPayload = kMaxSegmentPayload - kIccHeaderSize;
constexpr std::size_t kMaxChunkCount = 255;

constexpr std::size_t kDefaultSegmentLimit = 10000;

}  // namespace jpegicc::codec
