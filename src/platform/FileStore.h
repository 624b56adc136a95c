#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace jpegicc::platform {

// Whole-file reads and writes for the editor. All failures throw
// std::runtime_error naming the path.
std::vector<std::uint8_t> readFile(const std::filesystem::path& path);

void ensureWritableTarget(const std::filesystem::path& path, bool overwrite);

void writeFile(const std::filesystem::path& path,
               std::span<const std::uint8_t> bytes,
               bool overwrite);

}  // namespace jpegicc::platform
