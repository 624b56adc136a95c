#include "ProfileInspector.h"

#include <lcms2.h>

#include <algorithm>
#include <memory>

namespace jpegicc::profile {

std::string ProfileInspector::describe(const IccProfile& profile) const {
  if (profile.empty()) {
    return "Unknown";
  }
  std::unique_ptr<void, decltype(&cmsCloseProfile)> handle(
      cmsOpenProfileFromMem(profile.data().data(),
                            static_cast<cmsUInt32Number>(profile.size())),
      &cmsCloseProfile);
  if (!handle) {
    return "Unknown";
  }

  // Little CMS writes at most the buffer size including the terminator.
  std::string text(256, '\0');
  const auto written = cmsGetProfileInfoASCII(
      handle.get(), cmsInfoDescription, cmsNoLanguage, cmsNoCountry,
      text.data(), static_cast<cmsUInt32Number>(text.size()));
  if (written == 0) {
    return "Custom ICC Profile";
  }
  text.resize(std::min(text.find('\0'), text.size()));
  return text.empty() ? "Custom ICC Profile" : text;
}

ProfileSummary ProfileInspector::summarize(const IccProfile& profile) const {
  ProfileSummary summary;
  summary.size = profile.size();
  summary.chunk_count = profile.chunkCount();
  summary.rendering_intent = profile.renderingIntent();
  summary.description = describe(profile);
  return summary;
}

std::string renderingIntentName(std::uint32_t intent) {
  switch (static_cast<RenderingIntent>(intent)) {
    case RenderingIntent::kPerceptual:
      return "perceptual";
    case RenderingIntent::kRelativeColorimetric:
      return "relative-colorimetric";
    case RenderingIntent::kSaturation:
      return "saturation";
    case RenderingIntent::kAbsoluteColorimetric:
      return "absolute-colorimetric";
  }
  return "custom(" + std::to_string(intent) + ")";
}

}  // namespace jpegicc::profile
