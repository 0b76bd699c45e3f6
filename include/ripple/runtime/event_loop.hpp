#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "ripple/runtime/clock.hpp"

namespace ripple::runtime {

using Task = std::function<void()>;

struct TimerId {
  uint64_t value = 0;

  auto operator==(const TimerId&) const -> bool = default;

  template <typename H>
  friend auto AbslHashValue(H h, TimerId id) -> H {
    return H::combine(std::move(h), id.value);
  }
};

// Single-threaded cooperative loop. A tick runs the timers that are due and
// then every task that was queued when the tick began; tasks posted during a
// tick run in the next one.
class EventLoop {
 public:
  explicit EventLoop(Clock& clock) : clock_(clock) {
  }

  void Post(Task task);
  auto PostDelayed(Duration delay, Task task) -> TimerId;

  // Returns false when the timer already fired or was cancelled.
  auto Cancel(TimerId id) -> bool;

  // Runs one tick. Returns whether any task ran.
  auto RunOnce() -> bool;

  // Runs ticks until no task or timer is left, waiting on the clock for the
  // next timer when idle. Stops after `max_ticks`. Returns ticks run.
  auto RunUntilIdle(size_t max_ticks = 100000) -> size_t;

  [[nodiscard]] auto HasWork() const -> bool {
    return !ready_.empty() || !timers_.empty();
  }
  [[nodiscard]] auto PendingTasks() const -> size_t {
    return ready_.size();
  }
  [[nodiscard]] auto PendingTimers() const -> size_t {
    return timers_.size();
  }
  [[nodiscard]] auto GetClock() -> Clock& {
    return clock_;
  }

 private:
  void PromoteDueTimers();

  Clock& clock_;
  std::deque<Task> ready_;
  // Ordered by (deadline, id): timers with equal deadlines fire in the order
  // they were armed.
  std::map<std::pair<Duration, uint64_t>, Task> timers_;
  absl::flat_hash_map<TimerId, Duration> deadlines_;
  uint64_t next_timer_ = 1;
};

}  // namespace ripple::runtime
