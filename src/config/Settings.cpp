#include "Settings.h"

#include <cstdlib>
#include <stdexcept>

#include "codec/JpegMarkers.h"
#include "profile/IccProfile.h"

namespace jpegicc::config {

namespace {

unsigned long long parseUnsigned(const std::string& text, const std::string& what) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Invalid " + what + ": '" + text + "'");
  }
}

}  // namespace

std::size_t parseSegmentLimit(const std::string& text) {
  const auto value = parseUnsigned(text, "segment limit");
  if (value == 0) {
    throw std::invalid_argument("Segment limit must be positive");
  }
  return static_cast<std::size_t>(value);
}

std::uint32_t parseRenderingIntent(const std::string& text) {
  using profile::RenderingIntent;
  if (text == "perceptual") {
    return static_cast<std::uint32_t>(RenderingIntent::kPerceptual);
  }
  if (text == "relative" || text == "relative-colorimetric") {
    return static_cast<std::uint32_t>(RenderingIntent::kRelativeColorimetric);
  }
  if (text == "saturation") {
    return static_cast<std::uint32_t>(RenderingIntent::kSaturation);
  }
  if (text == "absolute" || text == "absolute-colorimetric") {
    return static_cast<std::uint32_t>(RenderingIntent::kAbsoluteColorimetric);
  }
  const auto value = parseUnsigned(text, "rendering intent");
  if (value > static_cast<std::uint32_t>(RenderingIntent::kAbsoluteColorimetric)) {
    throw std::invalid_argument("Rendering intent must be 0-3: '" + text + "'");
  }
  return static_cast<std::uint32_t>(value);
}

Settings::Settings()
    : segment_limit_(codec::kDefaultSegmentLimit),
      force_overwrite_(false),
      verbose_(false) {}

void Settings::loadDefaults() {
  segment_limit_ = codec::kDefaultSegmentLimit;
  force_overwrite_ = false;
  verbose_ = false;
  rendering_intent_.reset();
}

void Settings::loadFromEnvironment() {
  if (const char* limit = std::getenv(kSegmentLimitEnv)) {
    segment_limit_ = parseSegmentLimit(limit);
  }
}

std::vector<std::string> Settings::loadFromArguments(
    const std::vector<std::string>& args) {
  std::vector<std::string> positional;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "--force") {
      force_overwrite_ = true;
    } else if (arg == "--verbose") {
      verbose_ = true;
    } else if (arg == "--segment-limit" || arg == "--intent") {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + arg);
      }
      const auto& value = args[++i];
      if (arg == "--segment-limit") {
        segment_limit_ = parseSegmentLimit(value);
      } else {
        rendering_intent_ = parseRenderingIntent(value);
      }
    } else if (arg.rfind("--", 0) == 0) {
      throw std::invalid_argument("Unknown option " + arg);
    } else {
      positional.push_back(arg);
    }
  }
  return positional;
}

std::size_t Settings::segmentLimit() const noexcept {
  return segment_limit_;
}

bool Settings::forceOverwrite() const noexcept {
  return force_overwrite_;
}

bool Settings::verbose() const noexcept {
  return verbose_;
}

const std::optional<std::uint32_t>& Settings::renderingIntent() const noexcept {
  return rendering_intent_;
}

}  // namespace jpegicc::config
