#include "CodecError.h"

namespace jpegicc::codec {

std::string_view errorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kProfileTooLarge:
      return "ProfileTooLarge";
    case ErrorKind::kInvalidContainer:
      return "InvalidContainer";
  }
  return "Unknown";
}

CodecError::CodecError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

ErrorKind CodecError::kind() const noexcept {
  return kind_;
}

}  // namespace jpegicc::codec
