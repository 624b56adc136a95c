#include "FileStore.h"

#include <fstream>
#include <stdexcept>
#include <string>

namespace jpegicc::platform {

namespace {

std::filesystem::path parentDirectory(const std::filesystem::path& path) {
  const auto parent = path.parent_path();
  return parent.empty() ? std::filesystem::current_path() : parent;
}

}  // namespace

std::vector<std::uint8_t> readFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw std::runtime_error("File '" + path.string() + "' does not exist.");
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw std::runtime_error("'" + path.string() + "' is not a regular file.");
  }

  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("File '" + path.string() + "' isn't readable.");
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw std::runtime_error("Failed to stat '" + path.string() +
                             "': " + ec.message());
  }

  std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
  stream.read(reinterpret_cast<char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
  if (static_cast<std::size_t>(stream.gcount()) != data.size()) {
    throw std::runtime_error("Failed to read file content from '" +
                             path.string() + "'.");
  }
  return data;
}

void ensureWritableTarget(const std::filesystem::path& path, bool overwrite) {
  std::error_code ec;
  const auto dir = parentDirectory(path);
  if (!std::filesystem::is_directory(dir, ec)) {
    throw std::runtime_error("Directory '" + dir.string() + "' for file '" +
                             path.string() + "' does not exist.");
  }
  constexpr auto kWriteBits = std::filesystem::perms::owner_write |
                              std::filesystem::perms::group_write |
                              std::filesystem::perms::others_write;
  const auto permissions = std::filesystem::status(dir, ec).permissions();
  if (ec || (permissions & kWriteBits) == std::filesystem::perms::none) {
    throw std::runtime_error("Directory '" + dir.string() + "' for file '" +
                             path.string() + "' isn't writable.");
  }
  if (!overwrite && std::filesystem::exists(path, ec)) {
    throw std::runtime_error("File '" + path.string() +
                             "' already exists. Use force_overwrite option.");
  }
}

void writeFile(const std::filesystem::path& path,
               std::span<const std::uint8_t> bytes,
               bool overwrite) {
  ensureWritableTarget(path, overwrite);

  std::ofstream stream(path, std::ios::binary | std::ios::trunc);
  if (!stream) {
    throw std::runtime_error("Write failed for '" + path.string() +
                             "'. Check permissions and disk space.");
  }
  stream.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  stream.flush();
  if (!stream) {
    throw std::runtime_error("Write partially failed for '" + path.string() +
                             "' (" + std::to_string(bytes.size()) +
                             " bytes requested).");
  }
}

}  // namespace jpegicc::platform
