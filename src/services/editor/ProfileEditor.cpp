#include "ProfileEditor.h"

#include <stdexcept>
#include <utility>

#include "codec/BufferMutator.h"
#include "codec/ProfileAssembler.h"
#include "platform/FileStore.h"

namespace jpegicc::services::editor {

ProfileEditor::ProfileEditor(std::size_t segment_limit) {
  options_.segment_limit = segment_limit;
}

void ProfileEditor::setEventSink(codec::ScanEventSink sink) {
  options_.sink = std::move(sink);
}

void ProfileEditor::setSegmentLimit(std::size_t limit) {
  options_.segment_limit = limit;
}

void ProfileEditor::requireProfile() const {
  if (profile_.empty()) {
    throw std::runtime_error("No ICC profile loaded to save.");
  }
}

bool ProfileEditor::loadFromJpegBytes(std::span<const std::uint8_t> jpeg) {
  auto extracted = codec::extractProfile(jpeg, options_);
  if (!extracted) {
    return false;
  }
  profile_.setData(std::move(*extracted));
  return true;
}

std::vector<std::uint8_t> ProfileEditor::embedIntoJpegBytes(
    std::span<const std::uint8_t> jpeg) const {
  requireProfile();
  std::vector<std::uint8_t> working(jpeg.begin(), jpeg.end());
  codec::replaceProfileSegments(working, profile_.bytes(), options_);
  return working;
}

std::vector<std::uint8_t> ProfileEditor::stripJpegBytes(
    std::span<const std::uint8_t> jpeg,
    std::size_t* removed_segments) const {
  std::vector<std::uint8_t> working(jpeg.begin(), jpeg.end());
  const auto removed = codec::removeProfileSegments(working, options_);
  if (removed_segments) {
    *removed_segments = removed;
  }
  return working;
}

bool ProfileEditor::loadFromJpeg(const std::filesystem::path& path) {
  const auto data = platform::readFile(path);
  return loadFromJpegBytes(data);
}

void ProfileEditor::saveToJpeg(const std::filesystem::path& path) const {
  requireProfile();
  const auto original = platform::readFile(path);
  const auto updated = embedIntoJpegBytes(original);
  platform::writeFile(path, updated, true);
}

void ProfileEditor::loadFromIcc(const std::filesystem::path& path) {
  profile_.setData(platform::readFile(path));
}

void ProfileEditor::saveToIcc(const std::filesystem::path& path,
                              bool force_overwrite) const {
  requireProfile();
  platform::writeFile(path, profile_.bytes(), force_overwrite);
}

bool ProfileEditor::removeFromJpeg(const std::filesystem::path& input,
                                   const std::filesystem::path& output,
                                   bool force_overwrite) const {
  platform::ensureWritableTarget(output, force_overwrite);
  const auto original = platform::readFile(input);
  const auto stripped = stripJpegBytes(original);
  platform::writeFile(output, stripped, force_overwrite);
  return true;
}

void ProfileEditor::setProfile(std::vector<std::uint8_t> data) {
  profile_.setData(std::move(data));
}

const profile::IccProfile& ProfileEditor::profile() const noexcept {
  return profile_;
}

std::optional<std::uint32_t> ProfileEditor::renderingIntent() const {
  return profile_.renderingIntent();
}

void ProfileEditor::setRenderingIntent(std::uint32_t intent) {
  profile_.setRenderingIntent(intent);
}

}  // namespace jpegicc::services::editor
