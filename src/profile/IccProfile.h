#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace jpegicc::profile {

// Values of the ICC header rendering intent field.
enum class RenderingIntent : std::uint32_t {
  kPerceptual = 0,
  kRelativeColorimetric = 1,
  kSaturation = 2,
  kAbsoluteColorimetric = 3
};

class IccProfile {
public:
  static constexpr std::size_t kRenderingIntentOffset = 64;
  static constexpr std::size_t kRenderingIntentSize = 4;

  IccProfile() = default;
  explicit IccProfile(std::vector<std::uint8_t> data);

  void setData(std::vector<std::uint8_t> data);
  void clear();

  [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept;
  [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  // APP2 segments needed to embed the profile.
  [[nodiscard]] std::size_t chunkCount() const noexcept;

  // Unavailable when the profile is too short to hold the field.
  [[nodiscard]] std::optional<std::uint32_t> renderingIntent() const;
  // Silently ignored when the profile is too short to hold the field.
  void setRenderingIntent(std::uint32_t intent);
  void setRenderingIntent(RenderingIntent intent);

private:
  [[nodiscard]] bool hasRenderingIntentField() const noexcept;

  std::vector<std::uint8_t> data_;
  std::size_t chunk_count_{0};
};

}  // namespace jpegicc::profile
