#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace jpegicc::codec {

enum class ErrorKind { kProfileTooLarge, kInvalidContainer };

[[nodiscard]] std::string_view errorKindName(ErrorKind kind) noexcept;

// Thrown only for failures that abort a mutation. Scan-level problems
// (malformed or truncated segments, bad chunk headers) are recovered in place
// and reported through ScanEvent; a missing profile is an empty result.
class CodecError : public std::runtime_error {
public:
  CodecError(ErrorKind kind, const std::string& message);

  [[nodiscard]] ErrorKind kind() const noexcept;

private:
  ErrorKind kind_;
};

}  // namespace jpegicc::codec
