#include "ripple/runtime/cycle_handler.hpp"

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "ripple/common/log.hpp"

namespace ripple::runtime {

namespace {

auto MemberIds(const std::vector<ActionId>& members) -> std::vector<uint32_t> {
  std::vector<uint32_t> ids;
  ids.reserve(members.size());
  for (ActionId id : members) {
    ids.push_back(id.value);
  }
  return ids;
}

}  // namespace

auto CycleHandler::Handle(
    std::vector<ActionId> members, const std::vector<ActionId>& drivers)
    -> CycleOutcome {
  std::ranges::sort(members);
  if (auto it = slow_.find(members); it != slow_.end()) {
    return Slow(it->second, drivers);
  }

  bool fast = EstimateCost(members) < config_.fast_cycle_threshold;
  GetLogger()->debug(
      "cycle detected among actions [{}] ({})",
      fmt::join(MemberIds(members), ", "), fast ? "fast" : "slow");
  if (trace_ != nullptr) {
    trace_->EmitCycleDetected(members, fast);
  }
  if (!fast) {
    auto& record = slow_[members];
    record.members = members;
    return Slow(record, drivers);
  }
  return Fast(members, drivers);
}

auto CycleHandler::EstimateCost(const std::vector<ActionId>& members) const
    -> Duration {
  Duration total{0};
  for (ActionId id : members) {
    total += host_.AverageTime(id);
  }
  return total;
}

auto CycleHandler::SlowCycles() const -> std::vector<std::vector<ActionId>> {
  std::vector<std::vector<ActionId>> result;
  result.reserve(slow_.size());
  for (const auto& [members, record] : slow_) {
    result.push_back(members);
  }
  return result;
}

void CycleHandler::Forget(ActionId id) {
  for (auto it = slow_.begin(); it != slow_.end();) {
    if (std::ranges::find(it->first, id) != it->first.end()) {
      it = slow_.erase(it);
      continue;
    }
    std::erase(it->second.drivers, id);
    ++it;
  }
}

auto CycleHandler::Fast(
    const std::vector<ActionId>& members, const std::vector<ActionId>& drivers)
    -> CycleOutcome {
  std::vector<ActionId> order =
      TopologicalOrder(members, host_.CycleEdges(members));

  for (uint32_t pass = 1; pass <= config_.max_cycle_iterations; ++pass) {
    Duration cost = RunPass(order);
    if (!AnyDirty(members)) {
      Settle(members, CycleOutcome::kConverged, pass);
      return CycleOutcome::kConverged;
    }
    if (cost >= config_.fast_cycle_threshold) {
      // Too expensive to finish within this tick; continue across ticks.
      auto& record = slow_[members];
      record.members = members;
      record.drivers = drivers;
      record.iteration = pass;
      record.last_yield = clock_.Now();
      Settle(members, CycleOutcome::kYielded, pass);
      return CycleOutcome::kYielded;
    }
  }

  Diagnostic diag =
      Diagnostic::Warning(
          ErrorCode::kCycleNotConverged,
          fmt::format(
              "cycle among actions [{}] did not converge after {} iterations",
              fmt::join(MemberIds(members), ", "),
              config_.max_cycle_iterations))
          .WithCount(config_.max_cycle_iterations);
  if (!drivers.empty()) {
    diag = std::move(diag).ForAction(drivers.front());
  }
  host_.ReportCycle(std::move(diag));
  for (ActionId id : members) {
    host_.ClearDirty(id);
  }
  Settle(members, CycleOutcome::kNotConverged, config_.max_cycle_iterations);
  return CycleOutcome::kNotConverged;
}

auto CycleHandler::Slow(
    SlowCycleRecord& record, const std::vector<ActionId>& drivers)
    -> CycleOutcome {
  for (ActionId id : drivers) {
    if (std::ranges::find(record.drivers, id) == record.drivers.end()) {
      record.drivers.push_back(id);
    }
  }
  ++record.iteration;
  // Copy: the record may be erased below.
  std::vector<ActionId> members = record.members;

  if (record.iteration > config_.max_iterations_per_run) {
    uint32_t ran = record.iteration - 1;
    auto message = fmt::format(
        "slow cycle among actions [{}] did not converge within {} ticks",
        fmt::join(MemberIds(members), ", "), ran);
    if (record.drivers.empty()) {
      host_.ReportCycle(
          Diagnostic::Error(ErrorCode::kSlowCycleTimeout, message)
              .WithCount(ran));
    }
    for (ActionId driver : record.drivers) {
      host_.ReportCycle(
          Diagnostic::Error(ErrorCode::kSlowCycleTimeout, message)
              .ForAction(driver)
              .WithCount(ran));
    }
    for (ActionId id : members) {
      host_.ClearDirty(id);
    }
    slow_.erase(members);
    Settle(members, CycleOutcome::kTimedOut, ran);
    return CycleOutcome::kTimedOut;
  }

  uint32_t iteration = record.iteration;
  RunPass(TopologicalOrder(members, host_.CycleEdges(members)));
  if (!AnyDirty(members)) {
    slow_.erase(members);
    Settle(members, CycleOutcome::kConverged, iteration);
    return CycleOutcome::kConverged;
  }
  // RunPass may have unsubscribed a member, which erases the record.
  if (auto it = slow_.find(members); it != slow_.end()) {
    it->second.last_yield = clock_.Now();
  }
  Settle(members, CycleOutcome::kYielded, iteration);
  return CycleOutcome::kYielded;
}

auto CycleHandler::RunPass(const std::vector<ActionId>& order) -> Duration {
  Duration start = clock_.Now();
  for (ActionId id : order) {
    if (host_.IsDirty(id)) {
      host_.RunCycleMember(id);
    }
  }
  return clock_.Now() - start;
}

auto CycleHandler::AnyDirty(const std::vector<ActionId>& members) const
    -> bool {
  return std::ranges::any_of(
      members, [this](ActionId id) { return host_.IsDirty(id); });
}

void CycleHandler::Settle(
    const std::vector<ActionId>& members, CycleOutcome outcome,
    uint32_t iterations) {
  if (trace_ != nullptr) {
    trace_->EmitCycleSettled(members, outcome, iterations);
  }
}

}  // namespace ripple::runtime
