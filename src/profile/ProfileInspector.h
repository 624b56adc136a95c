#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "IccProfile.h"

namespace jpegicc::profile {

struct ProfileSummary {
  std::size_t size{};
  std::size_t chunk_count{};
  std::optional<std::uint32_t> rendering_intent;
  std::string description;
};

// Read-only view of a profile through Little CMS. Nothing here validates the
// profile; an unparsable profile simply has no description.
class ProfileInspector {
public:
  [[nodiscard]] std::string describe(const IccProfile& profile) const;
  [[nodiscard]] ProfileSummary summarize(const IccProfile& profile) const;
};

[[nodiscard]] std::string renderingIntentName(std::uint32_t intent);

}  // namespace jpegicc::profile
