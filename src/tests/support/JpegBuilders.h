#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace jpegicc::test_support {

using Bytes = std::vector<std::uint8_t>;

inline Bytes bytesOf(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

inline Bytes concat(std::initializer_list<Bytes> parts) {
  Bytes out;
  for (const auto& part : parts) {
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

inline Bytes soi() {
  return {0xFF, 0xD8};
}

inline Bytes eoi() {
  return {0xFF, 0xD9};
}

// Generic length-prefixed segment; `payload` excludes the length field.
inline Bytes segment(std::uint8_t type, const Bytes& payload) {
  const auto length = payload.size() + 2;
  Bytes out{0xFF, type, static_cast<std::uint8_t>(length >> 8),
            static_cast<std::uint8_t>(length & 0xFF)};
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

inline Bytes iccPayload(std::uint8_t index, std::uint8_t count, const Bytes& data) {
  Bytes payload = bytesOf("ICC_PROFILE");
  payload.push_back(0x00);
  payload.push_back(index);
  payload.push_back(count);
  payload.insert(payload.end(), data.begin(), data.end());
  return payload;
}

inline Bytes iccSegment(std::uint8_t index, std::uint8_t count, const Bytes& data) {
  return segment(0xE2, iccPayload(index, count, data));
}

inline Bytes iccSegment(std::uint8_t index, std::uint8_t count,
                        const std::string& data) {
  return iccSegment(index, count, bytesOf(data));
}

inline Bytes jfifSegment() {
  return segment(0xE0, {'J', 'F', 'I', 'F', 0x00, 0x01, 0x01, 0x00, 0x00,
                        0x01, 0x00, 0x01, 0x00, 0x00});
}

inline Bytes commentSegment(const std::string& text) {
  return segment(0xFE, bytesOf(text));
}

inline Bytes jpeg(std::initializer_list<Bytes> body) {
  Bytes out = soi();
  for (const auto& part : body) {
    out.insert(out.end(), part.begin(), part.end());
  }
  const auto tail = eoi();
  out.insert(out.end(), tail.begin(), tail.end());
  return out;
}

inline Bytes patternedProfile(std::size_t size, std::uint8_t seed = 0) {
  Bytes profile(size);
  for (std::size_t i = 0; i < size; ++i) {
    profile[i] = static_cast<std::uint8_t>((i * 31 + seed) & 0xFF);
  }
  return profile;
}

}  // namespace jpegicc::test_support
