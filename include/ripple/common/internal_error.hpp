#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace ripple::common {

// Exception type for internal engine errors (broken invariants, bad handles).
// Conditions that arise from user actions are reported as Diagnostics.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format("Internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace ripple::common
