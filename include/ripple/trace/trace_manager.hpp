#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ripple/common/ids.hpp"
#include "ripple/trace/trace_event.hpp"
#include "ripple/trace/trace_sink.hpp"

namespace ripple::trace {

class TraceManager {
 public:
  void SetEnabled(bool enabled) {
    enabled_ = enabled;
  }
  [[nodiscard]] bool IsEnabled() const {
    return enabled_;
  }

  void AddSink(std::unique_ptr<TraceSink> sink);

  void EmitActionRun(
      ActionId action, bool effect, std::chrono::nanoseconds duration);
  void EmitCycleDetected(std::vector<ActionId> members, bool fast);
  void EmitCycleSettled(
      std::vector<ActionId> members, CycleOutcome outcome,
      uint32_t iterations);
  void EmitDebounceArmed(
      ActionId action, std::chrono::nanoseconds interval, bool automatic);
  void EmitCommitSettled(ActionId action, bool accepted);

  // Post-run query.
  [[nodiscard]] auto Events() const -> const std::vector<TraceEvent>&;
  [[nodiscard]] auto CountRuns(ActionId action) const -> size_t;
  [[nodiscard]] auto CountCycles(CycleOutcome outcome) const -> size_t;
  void Clear() {
    events_.clear();
  }

  // One line per event kind plus one per action that ran:
  //   ripple-trace: runs=N cycles=C debounces=D commits=K rejected=R
  //   ripple-trace-action: action=A runs=N total_ms=T
  [[nodiscard]] auto Summary() const -> std::string;
  void PrintSummary() const;

 private:
  void Record(TraceEvent event);

  bool enabled_ = false;
  std::vector<TraceEvent> events_;
  std::vector<std::unique_ptr<TraceSink>> sinks_;
};

}  // namespace ripple::trace
