#include "IccProfile.h"

#include <utility>

#include "codec/ChunkEncoder.h"

namespace jpegicc::profile {

IccProfile::IccProfile(std::vector<std::uint8_t> data) {
  setData(std::move(data));
}

void IccProfile::setData(std::vector<std::uint8_t> data) {
  data_ = std::move(data);
  chunk_count_ = codec::chunkCountFor(data_.size());
}

void IccProfile::clear() {
  setData({});
}

const std::vector<std::uint8_t>& IccProfile::data() const noexcept {
  return data_;
}

std::span<const std::uint8_t> IccProfile::bytes() const noexcept {
  return data_;
}

std::size_t IccProfile::size() const noexcept {
  return data_.size();
}

bool IccProfile::empty() const noexcept {
  return data_.empty();
}

std::size_t IccProfile::chunkCount() const noexcept {
  return chunk_count_;
}

bool IccProfile::hasRenderingIntentField() const noexcept {
  return data_.size() >= kRenderingIntentOffset + kRenderingIntentSize;
}

std::optional<std::uint32_t> IccProfile::renderingIntent() const {
  if (!hasRenderingIntentField()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = 0; i < kRenderingIntentSize; ++i) {
    value = (value << 8) | data_[kRenderingIntentOffset + i];
  }
  return value;
}

void IccProfile::setRenderingIntent(std::uint32_t intent) {
  if (!hasRenderingIntentField()) {
    return;
  }
  for (std::size_t i = 0; i < kRenderingIntentSize; ++i) {
    const auto shift = 8 * (kRenderingIntentSize - 1 - i);
    data_[kRenderingIntentOffset + i] =
        static_cast<std::uint8_t>((intent >> shift) & 0xFF);
  }
}

void IccProfile::setRenderingIntent(RenderingIntent intent) {
  setRenderingIntent(static_cast<std::uint32_t>(intent));
}

}  // namespace jpegicc::profile
