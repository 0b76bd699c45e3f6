#pragma once

#include <cstdint>
#include <vector>

#include "absl/container/btree_map.h"
#include "ripple/common/diagnostic.hpp"
#include "ripple/common/ids.hpp"
#include "ripple/config/engine_config.hpp"
#include "ripple/runtime/clock.hpp"
#include "ripple/runtime/graph_algorithms.hpp"
#include "ripple/trace/trace_event.hpp"
#include "ripple/trace/trace_manager.hpp"

namespace ripple::runtime {

using CycleOutcome = trace::CycleOutcome;

// What the cycle handler needs from the scheduler that owns the actions.
class CycleHost {
 public:
  virtual ~CycleHost() = default;

  virtual void RunCycleMember(ActionId id) = 0;
  [[nodiscard]] virtual auto IsDirty(ActionId id) const -> bool = 0;
  virtual void ClearDirty(ActionId id) = 0;
  // Zero for actions that never ran.
  [[nodiscard]] virtual auto AverageTime(ActionId id) const -> Duration = 0;
  [[nodiscard]] virtual auto CycleEdges(
      const std::vector<ActionId>& members) const -> EdgeMap = 0;
  virtual void ReportCycle(Diagnostic diag) = 0;
};

// Drives strongly connected groups of actions to a fixpoint.
//
// Fast cycles (estimated cost below the threshold) iterate within the current
// tick, up to max_cycle_iterations passes. A pass that turns out to cost more
// than the threshold demotes the cycle to slow. Slow cycles run one pass per
// tick; their progress lives in a SlowCycleRecord until they converge or
// exceed max_iterations_per_run.
class CycleHandler {
 public:
  CycleHandler(
      CycleHost& host, Clock& clock, const config::EngineConfig& config,
      trace::TraceManager* trace = nullptr)
      : host_(host), clock_(clock), config_(config), trace_(trace) {
  }

  // `drivers` are the effects waiting on the cycle. On kYielded they must
  // not run this tick.
  auto Handle(std::vector<ActionId> members, const std::vector<ActionId>& drivers)
      -> CycleOutcome;

  [[nodiscard]] auto EstimateCost(const std::vector<ActionId>& members) const
      -> Duration;

  // Member sets of cycles paused mid-convergence.
  [[nodiscard]] auto SlowCycles() const -> std::vector<std::vector<ActionId>>;

  // Drops slow-cycle state that mentions `id`.
  void Forget(ActionId id);

 private:
  struct SlowCycleRecord {
    std::vector<ActionId> members;
    std::vector<ActionId> drivers;
    uint32_t iteration = 0;
    Duration last_yield{0};
  };

  auto Fast(const std::vector<ActionId>& members,
            const std::vector<ActionId>& drivers) -> CycleOutcome;
  auto Slow(SlowCycleRecord& record, const std::vector<ActionId>& drivers)
      -> CycleOutcome;
  // Runs dirty members once in order. Returns the clock time it took.
  auto RunPass(const std::vector<ActionId>& order) -> Duration;
  [[nodiscard]] auto AnyDirty(const std::vector<ActionId>& members) const
      -> bool;
  void Settle(
      const std::vector<ActionId>& members, CycleOutcome outcome,
      uint32_t iterations);

  CycleHost& host_;
  Clock& clock_;
  const config::EngineConfig& config_;
  trace::TraceManager* trace_;
  // Keyed by the sorted member list.
  absl::btree_map<std::vector<ActionId>, SlowCycleRecord> slow_;
};

}  // namespace ripple::runtime
