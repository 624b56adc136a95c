#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jpegicc::config {

class Settings {
public:
  static constexpr const char* kSegmentLimitEnv = "JPEGICC_SEGMENT_LIMIT";

  Settings();

  void loadDefaults();
  void loadFromEnvironment();
  // Consumes recognised flags and returns the remaining positional
  // arguments. Throws std::invalid_argument on a bad flag value.
  std::vector<std::string> loadFromArguments(const std::vector<std::string>& args);

  [[nodiscard]] std::size_t segmentLimit() const noexcept;
  [[nodiscard]] bool forceOverwrite() const noexcept;
  [[nodiscard]] bool verbose() const noexcept;
  [[nodiscard]] const std::optional<std::uint32_t>& renderingIntent() const noexcept;

private:
  std::size_t segment_limit_;
  bool force_overwrite_;
  bool verbose_;
  std::optional<std::uint32_t> rendering_intent_;
};

std::size_t parseSegmentLimit(const std::string& text);
std::uint32_t parseRenderingIntent(const std::string& text);

}  // namespace jpegicc::config
