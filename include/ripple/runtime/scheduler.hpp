#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "ripple/common/diagnostic.hpp"
#include "ripple/common/diagnostic_sink.hpp"
#include "ripple/common/ids.hpp"
#include "ripple/config/engine_config.hpp"
#include "ripple/runtime/action.hpp"
#include "ripple/runtime/cycle_handler.hpp"
#include "ripple/runtime/debounce_controller.hpp"
#include "ripple/runtime/dependency_graph.hpp"
#include "ripple/runtime/event_loop.hpp"
#include "ripple/storage/remote_store.hpp"
#include "ripple/storage/tier_manager.hpp"
#include "ripple/storage/transaction.hpp"
#include "ripple/storage/value.hpp"
#include "ripple/trace/trace_manager.hpp"

namespace ripple::runtime {

using ErrorHandler = std::function<void(const Diagnostic&)>;
using EventHandler =
    std::function<void(storage::Transaction&, const storage::Value&)>;

// Reactive run loop over subscribed actions.
//
// Storage changes reach the scheduler through a TierManager listener. In push
// mode (the default) every triggered action is scheduled directly. In pull
// mode a triggered computation is only marked dirty, and the effects
// downstream of it are scheduled; Execute() then pulls the dirty computations
// those effects depend on.
//
// Each Execute() is one tick: at most one queued event, then the current work
// set in dependency order. Remaining work is posted as a later tick on the
// event loop.
class Scheduler : private CycleHost {
 public:
  Scheduler(
      storage::TierManager& tiers, EventLoop& loop,
      const config::EngineConfig& config, DiagnosticSink& diagnostics,
      trace::TraceManager* trace = nullptr);
  ~Scheduler() override;

  Scheduler(const Scheduler&) = delete;
  auto operator=(const Scheduler&) -> Scheduler& = delete;
  Scheduler(Scheduler&&) = delete;
  auto operator=(Scheduler&&) -> Scheduler& = delete;

  // `log` is the initial dependency set; it is replaced after every run.
  // A subscription over the configured limits throws DiagnosticException.
  auto Subscribe(ActionFn fn, ReactivityLog log, SubscribeOptions options = {})
      -> ActionId;
  void Resubscribe(ActionId id, ReactivityLog log);
  // Removes every trace of the action. Unknown ids are ignored.
  void Unsubscribe(ActionId id);

  // Marks the action and everything downstream of it dirty.
  void MarkDirty(ActionId id);

  // Pulls the action's dirty dependencies, then runs it. Fails with the
  // diagnostic of the action's own failure, if any.
  auto Run(ActionId id) -> Result<void>;

  void Execute();
  // Posts a single Execute() on the event loop if none is queued.
  void QueueExecution();

  // Runs `handler` in its own transaction on a later tick. A rejected commit
  // re-queues the event at the front, up to `retries` times.
  void QueueEvent(
      EventHandler handler, storage::Value event,
      storage::CommitCallback on_commit = {},
      std::optional<uint32_t> retries = std::nullopt);

  void OnError(ErrorHandler handler);
  void SetPullMode(bool pull);
  [[nodiscard]] auto IsPullMode() const -> bool {
    return pull_mode_;
  }

  void SetDebounce(ActionId id, Duration interval);
  // Drops both the configured and the automatic interval.
  void ClearDebounce(ActionId id);
  void SetAutoDebounce(ActionId id, bool enabled);
  void SetThrottle(ActionId id, Duration period);
  void ClearThrottle(ActionId id);
  [[nodiscard]] auto GetDebounce(ActionId id) const -> std::optional<Duration>;

  [[nodiscard]] auto GetStats() const -> SchedulerStats;
  [[nodiscard]] auto GetActionStats(ActionId id) const -> const ActionStats&;
  [[nodiscard]] auto IsDirty(ActionId id) const -> bool override;
  [[nodiscard]] auto IsPending(ActionId id) const -> bool;
  [[nodiscard]] auto IsEffect(ActionId id) const -> bool;
  [[nodiscard]] auto IsComputation(ActionId id) const -> bool;
  [[nodiscard]] auto Contains(ActionId id) const -> bool;
  [[nodiscard]] auto Dependents(ActionId id) const -> std::vector<ActionId>;
  [[nodiscard]] auto GetGraph() const -> const DependencyGraph& {
    return graph_;
  }

 private:
  struct Action {
    ActionFn fn;
    ActionKind kind;
    ActionStats stats;
    std::vector<storage::Address> potential_writes;
    // Runs since the loop was last idle.
    uint32_t loop_count = 0;
    uint32_t conflict_retries = 0;
  };

  struct QueuedEvent {
    EventHandler handler;
    storage::Value event;
    storage::CommitCallback on_commit;
    uint32_t retries_left;
  };

  void OnStorageChange(const storage::StorageChange& change);
  void ScheduleEffect(ActionId id);
  void ScheduleAffectedEffects(ActionId id);
  void ProcessEvent();

  // Work set for `roots`: the roots plus, with `pull`, every dirty
  // computation they transitively depend on. Sets `saw_cycle` when the
  // pull re-enters an action already on the stack.
  auto CollectWork(
      const std::vector<ActionId>& roots, bool pull, bool& saw_cycle)
      -> std::vector<ActionId>;
  void ProcessWorkSet(std::vector<ActionId> work, bool saw_cycle);
  void ExecuteOne(ActionId id);
  auto RunAction(ActionId id) -> bool;
  void RecordRun(ActionId id, Duration started, Duration elapsed);
  void ResetLoopCounts();
  void OnCommitSettled(ActionId id, const storage::CommitOutcome& outcome);
  void HandleConflict(ActionId id, Diagnostic diag);
  void Report(Diagnostic diag);

  auto GetAction(ActionId id) -> Action&;
  [[nodiscard]] auto GetAction(ActionId id) const -> const Action&;

  // CycleHost
  void RunCycleMember(ActionId id) override;
  void ClearDirty(ActionId id) override;
  [[nodiscard]] auto AverageTime(ActionId id) const -> Duration override;
  [[nodiscard]] auto CycleEdges(const std::vector<ActionId>& members) const
      -> EdgeMap override;
  void ReportCycle(Diagnostic diag) override;

  storage::TierManager& tiers_;
  EventLoop& loop_;
  const config::EngineConfig& config_;
  DiagnosticSink& diagnostics_;
  trace::TraceManager* trace_;

  DependencyGraph graph_;
  DebounceController debounce_;
  CycleHandler cycles_;
  storage::ListenerId listener_;

  absl::flat_hash_map<ActionId, Action> actions_;
  uint32_t next_id_ = 0;
  absl::btree_set<ActionId> dirty_;
  absl::btree_set<ActionId> pending_;
  // Work-set members of the current tick that have not run yet. Triggers
  // for them only mark dirty, so they run once per tick.
  absl::flat_hash_set<ActionId> in_flight_;
  std::optional<ActionId> running_;
  std::deque<QueuedEvent> events_;
  std::vector<ErrorHandler> error_handlers_;
  bool pull_mode_;
  bool execution_queued_ = false;
  // Diagnostics about the action a public Run() targets.
  std::optional<Diagnostic> run_failure_;
  std::optional<ActionId> run_target_;
  // Expires with the scheduler; loop tasks and remote callbacks check it.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}  // namespace ripple::runtime
