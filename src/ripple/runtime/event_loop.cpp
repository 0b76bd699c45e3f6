#include "ripple/runtime/event_loop.hpp"

#include <cstddef>
#include <utility>

namespace ripple::runtime {

void EventLoop::Post(Task task) {
  ready_.push_back(std::move(task));
}

auto EventLoop::PostDelayed(Duration delay, Task task) -> TimerId {
  TimerId id{.value = next_timer_++};
  Duration deadline = clock_.Now() + delay;
  timers_.emplace(std::make_pair(deadline, id.value), std::move(task));
  deadlines_.emplace(id, deadline);
  return id;
}

auto EventLoop::Cancel(TimerId id) -> bool {
  auto it = deadlines_.find(id);
  if (it == deadlines_.end()) {
    return false;
  }
  timers_.erase(std::make_pair(it->second, id.value));
  deadlines_.erase(it);
  return true;
}

void EventLoop::PromoteDueTimers() {
  Duration now = clock_.Now();
  while (!timers_.empty() && timers_.begin()->first.first <= now) {
    auto node = timers_.extract(timers_.begin());
    deadlines_.erase(TimerId{.value = node.key().second});
    ready_.push_back(std::move(node.mapped()));
  }
}

auto EventLoop::RunOnce() -> bool {
  PromoteDueTimers();
  size_t count = ready_.size();
  for (size_t i = 0; i < count; ++i) {
    Task task = std::move(ready_.front());
    ready_.pop_front();
    task();
  }
  return count > 0;
}

auto EventLoop::RunUntilIdle(size_t max_ticks) -> size_t {
  size_t ticks = 0;
  while (HasWork() && ticks < max_ticks) {
    if (ready_.empty()) {
      clock_.WaitUntil(timers_.begin()->first.first);
    }
    if (RunOnce()) {
      ++ticks;
    }
  }
  return ticks;
}

}  // namespace ripple::runtime
