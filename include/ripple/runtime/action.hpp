#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "ripple/common/ids.hpp"
#include "ripple/runtime/clock.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/reactivity_log.hpp"
#include "ripple/storage/transaction.hpp"

namespace ripple::runtime {

using storage::ReactivityLog;

// Effects are run eagerly when scheduled. Computations only run when an
// effect (or an explicit Run) pulls them.
enum class ActionKind : uint8_t {
  kEffect,
  kComputation,
};

using ActionFn = std::function<void(storage::Transaction&)>;

struct ActionStats {
  uint64_t run_count = 0;
  Duration total_time{0};
  Duration average_time{0};
  Duration last_run_time{0};
  // Clock reading when the last run started.
  std::optional<Duration> last_run_at;
};

struct SubscribeOptions {
  ActionKind kind = ActionKind::kComputation;
  // Mark dirty and pending right away so the first Execute runs it.
  bool schedule_immediately = false;
  std::optional<Duration> debounce;
  // Overrides the engine-wide auto-debounce setting for this action.
  std::optional<bool> auto_debounce;
  std::optional<Duration> throttle;
};

struct SchedulerStats {
  size_t effects = 0;
  size_t computations = 0;
  size_t pending = 0;
  size_t dirty = 0;
};

}  // namespace ripple::runtime
