#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace genarena::common {

// Exception type for misuse of a container (caller bugs, not absent values)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format("Internal error in {}: {}", context, detail)) {
  }
};

// Helper function to throw internal error (marked [[noreturn]] for
// optimization)
[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace genarena::common
