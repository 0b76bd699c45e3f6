#pragma once

#include <optional>

#include "absl/container/flat_hash_map.h"
#include "ripple/common/ids.hpp"
#include "ripple/config/engine_config.hpp"
#include "ripple/runtime/action.hpp"
#include "ripple/runtime/clock.hpp"
#include "ripple/runtime/event_loop.hpp"
#include "ripple/trace/trace_manager.hpp"

namespace ripple::runtime {

// Per-action debounce timers and throttle windows.
//
// Debounce: only the last trigger inside the interval enqueues the action.
// Auto-debounce: once an action has run often enough and averages above the
// threshold, it gets min(2 * average, cap) unless an interval was configured.
// Throttle: an action that ran less than `period` ago is skipped (it stays
// dirty and may be pulled later).
class DebounceController {
 public:
  DebounceController(
      EventLoop& loop, const config::EngineConfig& config,
      trace::TraceManager* trace = nullptr)
      : loop_(loop), config_(config), trace_(trace) {
  }

  void SetDebounce(ActionId id, Duration interval);
  void ClearDebounce(ActionId id);
  // Configured interval, or the auto-detected one.
  [[nodiscard]] auto GetDebounce(ActionId id) const -> std::optional<Duration>;

  void SetAutoDebounce(ActionId id, bool enabled);

  void SetThrottle(ActionId id, Duration period);
  void ClearThrottle(ActionId id);
  [[nodiscard]] auto ShouldSkip(ActionId id, const ActionStats& stats) const
      -> bool;

  // Called after each run. May arm auto-debounce for the action.
  void RecordRun(ActionId id, const ActionStats& stats);

  // Enqueues now when the action has no interval; otherwise (re)arms its
  // timer so `enqueue` runs once the interval passes without new triggers.
  void Schedule(ActionId id, Task enqueue);

  [[nodiscard]] auto HasTimer(ActionId id) const -> bool;

  // Cancels any timer and drops every setting for the action.
  void Forget(ActionId id);

 private:
  struct Entry {
    std::optional<Duration> configured;
    std::optional<Duration> automatic;
    std::optional<bool> auto_enabled;
    std::optional<Duration> throttle;
    std::optional<TimerId> timer;
  };

  [[nodiscard]] auto Find(ActionId id) const -> const Entry*;

  EventLoop& loop_;
  const config::EngineConfig& config_;
  trace::TraceManager* trace_;
  absl::flat_hash_map<ActionId, Entry> entries_;
};

}  // namespace ripple::runtime
