#include "ripple/runtime/clock.hpp"

#include <chrono>
#include <thread>

namespace ripple::runtime {

auto SteadyClock::Now() const -> Duration {
  return std::chrono::duration_cast<Duration>(
      std::chrono::steady_clock::now() - origin_);
}

void SteadyClock::WaitUntil(Duration deadline) {
  std::this_thread::sleep_until(origin_ + deadline);
}

}  // namespace ripple::runtime
