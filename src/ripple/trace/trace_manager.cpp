#include "ripple/trace/trace_manager.hpp"

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace ripple::trace {

void TraceManager::AddSink(std::unique_ptr<TraceSink> sink) {
  sinks_.push_back(std::move(sink));
}

void TraceManager::EmitActionRun(
    ActionId action, bool effect, std::chrono::nanoseconds duration) {
  Record(ActionRun{.action = action, .effect = effect, .duration = duration});
}

void TraceManager::EmitCycleDetected(std::vector<ActionId> members, bool fast) {
  Record(CycleDetected{.members = std::move(members), .fast = fast});
}

void TraceManager::EmitCycleSettled(
    std::vector<ActionId> members, CycleOutcome outcome, uint32_t iterations) {
  Record(
      CycleSettled{
          .members = std::move(members),
          .outcome = outcome,
          .iterations = iterations});
}

void TraceManager::EmitDebounceArmed(
    ActionId action, std::chrono::nanoseconds interval, bool automatic) {
  Record(
      DebounceArmed{
          .action = action, .interval = interval, .automatic = automatic});
}

void TraceManager::EmitCommitSettled(ActionId action, bool accepted) {
  Record(CommitSettled{.action = action, .accepted = accepted});
}

auto TraceManager::Events() const -> const std::vector<TraceEvent>& {
  return events_;
}

auto TraceManager::CountRuns(ActionId action) const -> size_t {
  size_t count = 0;
  for (const auto& event : events_) {
    if (const auto* run = std::get_if<ActionRun>(&event)) {
      if (run->action == action) {
        ++count;
      }
    }
  }
  return count;
}

auto TraceManager::CountCycles(CycleOutcome outcome) const -> size_t {
  size_t count = 0;
  for (const auto& event : events_) {
    if (const auto* settled = std::get_if<CycleSettled>(&event)) {
      if (settled->outcome == outcome) {
        ++count;
      }
    }
  }
  return count;
}

auto TraceManager::Summary() const -> std::string {
  size_t runs = 0;
  size_t cycles = 0;
  size_t debounces = 0;
  size_t commits = 0;
  size_t rejected = 0;

  struct ActionCounts {
    size_t runs = 0;
    std::chrono::nanoseconds total{0};
  };
  std::map<uint32_t, ActionCounts> per_action;

  for (const auto& event : events_) {
    std::visit(
        [&](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, ActionRun>) {
            ++runs;
            auto& counts = per_action[e.action.value];
            ++counts.runs;
            counts.total += e.duration;
          } else if constexpr (std::is_same_v<T, CycleDetected>) {
            ++cycles;
          } else if constexpr (std::is_same_v<T, DebounceArmed>) {
            ++debounces;
          } else if constexpr (std::is_same_v<T, CommitSettled>) {
            ++commits;
            if (!e.accepted) {
              ++rejected;
            }
          }
        },
        event);
  }

  std::string out = fmt::format(
      "ripple-trace: runs={} cycles={} debounces={} commits={} rejected={}\n",
      runs, cycles, debounces, commits, rejected);
  for (const auto& [action, counts] : per_action) {
    out += fmt::format(
        "ripple-trace-action: action={} runs={} total_ms={:.3f}\n", action,
        counts.runs,
        std::chrono::duration<double, std::milli>(counts.total).count());
  }
  return out;
}

void TraceManager::PrintSummary() const {
  fmt::print(stderr, "{}", Summary());
}

void TraceManager::Record(TraceEvent event) {
  if (!enabled_) {
    return;
  }
  for (auto& sink : sinks_) {
    sink->OnEvent(event);
  }
  events_.push_back(std::move(event));
}

}  // namespace ripple::trace
