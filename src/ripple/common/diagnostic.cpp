#include "ripple/common/diagnostic.hpp"

#include <string>

#include <fmt/format.h>

namespace ripple {

auto ToString(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kIterationLimitExceeded:
      return "iteration-limit-exceeded";
    case ErrorCode::kCommitConflict:
      return "commit-conflict";
    case ErrorCode::kSlowCycleTimeout:
      return "slow-cycle-timeout";
    case ErrorCode::kCycleNotConverged:
      return "cycle-not-converged";
    case ErrorCode::kActionFailed:
      return "action-failed";
    case ErrorCode::kStoreError:
      return "store-error";
    case ErrorCode::kConfigError:
      return "config-error";
    case ErrorCode::kSubscriptionLimit:
      return "subscription-limit";
  }
  return "unknown";
}

namespace {

auto KindName(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "unknown";
}

}  // namespace

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out = fmt::format(
      "{}[{}]", KindName(diag.primary.kind), ToString(diag.code));
  if (diag.action) {
    out += fmt::format(" (action {})", diag.action->value);
  }
  out += fmt::format(": {}", diag.primary.message);
  for (const auto& note : diag.notes) {
    out += fmt::format("\n  {}: {}", KindName(note.kind), note.message);
  }
  return out;
}

}  // namespace ripple
