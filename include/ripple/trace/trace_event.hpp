#pragma once

#include <chrono>
#include <cstdint>
#include <variant>
#include <vector>

#include "ripple/common/ids.hpp"

namespace ripple::trace {

struct ActionRun {
  ActionId action;
  bool effect;
  std::chrono::nanoseconds duration;
};

// A strongly connected set of actions found in a work set.
struct CycleDetected {
  std::vector<ActionId> members;
  // Classified as cheap enough to converge within one tick.
  bool fast;
};

enum class CycleOutcome : uint8_t {
  kConverged,
  kNotConverged,  // Fast path gave up after its iteration limit
  kYielded,       // Slow path paused until a later tick
  kTimedOut,      // Slow path exceeded the per-run iteration limit
};

struct CycleSettled {
  std::vector<ActionId> members;
  CycleOutcome outcome;
  uint32_t iterations;
};

struct DebounceArmed {
  ActionId action;
  std::chrono::nanoseconds interval;
  // Chosen by auto-debounce rather than configured.
  bool automatic;
};

// Remote answer for a commit made by an action (or an event handler, with
// an invalid id).
struct CommitSettled {
  ActionId action;
  bool accepted;
};

using TraceEvent = std::variant<
    ActionRun, CycleDetected, CycleSettled, DebounceArmed, CommitSettled>;

}  // namespace ripple::trace
