#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "codec/ScanEvents.h"
#include "profile/IccProfile.h"

namespace jpegicc::services::editor {

// Holds one ICC profile and moves it between JPEG containers and standalone
// .icc files. Buffer edits are made on a copy and only returned on success.
class ProfileEditor {
public:
  explicit ProfileEditor(std::size_t segment_limit = codec::kDefaultSegmentLimit);

  void setEventSink(codec::ScanEventSink sink);
  void setSegmentLimit(std::size_t limit);

  // Returns false when no complete profile is embedded; the current profile
  // is left untouched in that case.
  bool loadFromJpegBytes(std::span<const std::uint8_t> jpeg);
  [[nodiscard]] std::vector<std::uint8_t> embedIntoJpegBytes(
      std::span<const std::uint8_t> jpeg) const;
  [[nodiscard]] std::vector<std::uint8_t> stripJpegBytes(
      std::span<const std::uint8_t> jpeg,
      std::size_t* removed_segments = nullptr) const;

  bool loadFromJpeg(const std::filesystem::path& path);
  void saveToJpeg(const std::filesystem::path& path) const;
  void loadFromIcc(const std::filesystem::path& path);
  void saveToIcc(const std::filesystem::path& path, bool force_overwrite = false) const;
  bool removeFromJpeg(const std::filesystem::path& input,
                      const std::filesystem::path& output,
                      bool force_overwrite = false) const;

  void setProfile(std::vector<std::uint8_t> data);
  [[nodiscard]] const profile::IccProfile& profile() const noexcept;
  [[nodiscard]] std::optional<std::uint32_t> renderingIntent() const;
  void setRenderingIntent(std::uint32_t intent);

private:
  void requireProfile() const;

  profile::IccProfile profile_;
  codec::ScanOptions options_;
};

}  // namespace jpegicc::services::editor
