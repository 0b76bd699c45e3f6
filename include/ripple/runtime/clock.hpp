#pragma once

#include <chrono>

namespace ripple::runtime {

// Time since the clock's origin.
using Duration = std::chrono::nanoseconds;

class Clock {
 public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual auto Now() const -> Duration = 0;

  // Blocks (or jumps, for simulated clocks) until Now() >= deadline.
  virtual void WaitUntil(Duration deadline) = 0;
};

class SteadyClock : public Clock {
 public:
  SteadyClock() : origin_(std::chrono::steady_clock::now()) {
  }

  [[nodiscard]] auto Now() const -> Duration override;
  void WaitUntil(Duration deadline) override;

 private:
  std::chrono::steady_clock::time_point origin_;
};

// Deterministic clock for tests. Time moves only when told to.
class ManualClock : public Clock {
 public:
  [[nodiscard]] auto Now() const -> Duration override {
    return now_;
  }

  void WaitUntil(Duration deadline) override {
    if (deadline > now_) {
      now_ = deadline;
    }
  }

  void Advance(Duration delta) {
    now_ += delta;
  }

 private:
  Duration now_{0};
};

}  // namespace ripple::runtime
