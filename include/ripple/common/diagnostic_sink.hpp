#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "ripple/common/diagnostic.hpp"

namespace ripple {

// Collects diagnostics raised by the run loop. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.IsError()) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(ErrorCode code, std::string msg) {
    Report(Diagnostic::Error(code, std::move(msg)));
  }

  void Warning(ErrorCode code, std::string msg) {
    Report(Diagnostic::Warning(code, std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  [[nodiscard]] auto Count(ErrorCode code) const -> size_t {
    size_t n = 0;
    for (const auto& diag : diagnostics_) {
      if (diag.code == code) {
        ++n;
      }
    }
    return n;
  }

  void Clear() {
    diagnostics_.clear();
    has_errors_ = false;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace ripple
