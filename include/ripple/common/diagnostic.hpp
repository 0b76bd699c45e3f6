#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ripple/common/ids.hpp"

namespace ripple {

enum class DiagKind : uint8_t {
  kError,    // Action or commit failed; the loop keeps going
  kWarning,  // Degraded result (e.g. a cycle settled without converging)
  kNote,     // Auxiliary message
};

enum class ErrorCode : uint8_t {
  kIterationLimitExceeded,
  kCommitConflict,
  kSlowCycleTimeout,
  kCycleNotConverged,
  kActionFailed,
  kStoreError,
  kConfigError,
  kSubscriptionLimit,
};

auto ToString(ErrorCode code) -> const char*;

struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

struct Diagnostic {
  DiagItem primary;
  ErrorCode code = ErrorCode::kActionFailed;
  // Action the diagnostic is about, when there is one.
  std::optional<ActionId> action;
  // Iteration count for limit diagnostics, 0 otherwise.
  uint32_t count = 0;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Error(ErrorCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .code = code,
        .action = std::nullopt,
        .count = 0,
        .notes = {},
    };
  }

  static auto Warning(ErrorCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kWarning, .message = std::move(msg)},
        .code = code,
        .action = std::nullopt,
        .count = 0,
        .notes = {},
    };
  }

  auto ForAction(ActionId id) && -> Diagnostic {
    action = id;
    return std::move(*this);
  }

  auto WithCount(uint32_t n) && -> Diagnostic {
    count = n;
    return std::move(*this);
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back({.kind = DiagKind::kNote, .message = std::move(msg)});
    return std::move(*this);
  }

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind == DiagKind::kError;
  }
};

// Renders "error[commit-conflict] (action 3): message" plus indented notes.
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

// Result type for operations that can fail with a diagnostic.
template <typename T>
using Result = std::expected<T, Diagnostic>;

// Exception carrying a diagnostic, for paths that cannot return a Result.
class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }

  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

}  // namespace ripple
