#include "ripple/runtime/debounce_controller.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <utility>

#include "ripple/common/log.hpp"

namespace ripple::runtime {

void DebounceController::SetDebounce(ActionId id, Duration interval) {
  auto& entry = entries_[id];
  if (interval <= Duration::zero()) {
    entry.configured.reset();
    return;
  }
  entry.configured = interval;
}

void DebounceController::ClearDebounce(ActionId id) {
  if (auto it = entries_.find(id); it != entries_.end()) {
    it->second.configured.reset();
    it->second.automatic.reset();
  }
}

auto DebounceController::GetDebounce(ActionId id) const
    -> std::optional<Duration> {
  const Entry* entry = Find(id);
  if (entry == nullptr) {
    return std::nullopt;
  }
  if (entry->configured) {
    return entry->configured;
  }
  return entry->automatic;
}

void DebounceController::SetAutoDebounce(ActionId id, bool enabled) {
  auto& entry = entries_[id];
  entry.auto_enabled = enabled;
  if (!enabled) {
    entry.automatic.reset();
  }
}

void DebounceController::SetThrottle(ActionId id, Duration period) {
  entries_[id].throttle = period;
}

void DebounceController::ClearThrottle(ActionId id) {
  if (auto it = entries_.find(id); it != entries_.end()) {
    it->second.throttle.reset();
  }
}

auto DebounceController::ShouldSkip(ActionId id, const ActionStats& stats) const
    -> bool {
  const Entry* entry = Find(id);
  if (entry == nullptr || !entry->throttle || !stats.last_run_at) {
    return false;
  }
  Duration since_last = loop_.GetClock().Now() - *stats.last_run_at;
  return since_last < *entry->throttle;
}

void DebounceController::RecordRun(ActionId id, const ActionStats& stats) {
  const Entry* existing = Find(id);
  bool enabled = config_.auto_debounce;
  if (existing != nullptr && existing->auto_enabled) {
    enabled = *existing->auto_enabled;
  }
  if (!enabled || (existing != nullptr && existing->configured)) {
    return;
  }
  if (stats.run_count < config_.auto_debounce_min_runs ||
      stats.average_time < config_.auto_debounce_threshold) {
    return;
  }

  Duration interval = std::min<Duration>(
      stats.average_time * 2, config_.max_auto_debounce);
  auto& entry = entries_[id];
  if (entry.automatic == interval) {
    return;
  }
  entry.automatic = interval;
  GetLogger()->debug(
      "auto-debounce action {} at {}ms", id.value,
      std::chrono::duration_cast<std::chrono::milliseconds>(interval).count());
  if (trace_ != nullptr) {
    trace_->EmitDebounceArmed(id, interval, true);
  }
}

void DebounceController::Schedule(ActionId id, Task enqueue) {
  auto interval = GetDebounce(id);
  if (!interval) {
    enqueue();
    return;
  }

  auto& entry = entries_[id];
  if (entry.timer) {
    loop_.Cancel(*entry.timer);
  }
  entry.timer = loop_.PostDelayed(
      *interval, [this, id, enqueue = std::move(enqueue)] {
        if (auto it = entries_.find(id); it != entries_.end()) {
          it->second.timer.reset();
        }
        enqueue();
      });
}

auto DebounceController::HasTimer(ActionId id) const -> bool {
  const Entry* entry = Find(id);
  return entry != nullptr && entry->timer.has_value();
}

void DebounceController::Forget(ActionId id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return;
  }
  if (it->second.timer) {
    loop_.Cancel(*it->second.timer);
  }
  entries_.erase(it);
}

auto DebounceController::Find(ActionId id) const -> const Entry* {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

}  // namespace ripple::runtime
