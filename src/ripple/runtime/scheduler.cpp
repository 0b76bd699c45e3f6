#include "ripple/runtime/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "ripple/common/internal_error.hpp"
#include "ripple/common/log.hpp"
#include "ripple/runtime/graph_algorithms.hpp"

namespace ripple::runtime {

namespace {

auto ToMillis(Duration d) -> double {
  return std::chrono::duration<double, std::milli>(d).count();
}

// Marks `id` as the running action and restores the outer one on exit.
class RunningScope {
 public:
  RunningScope(std::optional<ActionId>& running, ActionId id)
      : running_(running), outer_(std::exchange(running, id)) {
  }
  ~RunningScope() {
    running_ = outer_;
  }

  RunningScope(const RunningScope&) = delete;
  RunningScope(RunningScope&&) = delete;
  auto operator=(const RunningScope&) -> RunningScope& = delete;
  auto operator=(RunningScope&&) -> RunningScope& = delete;

 private:
  std::optional<ActionId>& running_;
  std::optional<ActionId> outer_;
};

// Releases every member of a work set from the in-flight set on exit, so a
// work set cut short never leaves members that later triggers skip.
class InFlightScope {
 public:
  InFlightScope(
      absl::flat_hash_set<ActionId>& in_flight,
      const std::vector<ActionId>& work)
      : in_flight_(in_flight), work_(work) {
  }
  ~InFlightScope() {
    for (ActionId id : work_) {
      in_flight_.erase(id);
    }
  }

  InFlightScope(const InFlightScope&) = delete;
  InFlightScope(InFlightScope&&) = delete;
  auto operator=(const InFlightScope&) -> InFlightScope& = delete;
  auto operator=(InFlightScope&&) -> InFlightScope& = delete;

 private:
  absl::flat_hash_set<ActionId>& in_flight_;
  const std::vector<ActionId>& work_;
};

}  // namespace

Scheduler::Scheduler(
    storage::TierManager& tiers, EventLoop& loop,
    const config::EngineConfig& config, DiagnosticSink& diagnostics,
    trace::TraceManager* trace)
    : tiers_(tiers),
      loop_(loop),
      config_(config),
      diagnostics_(diagnostics),
      trace_(trace),
      graph_(
          SubscriptionLimits{
              .max_per_action = config.max_subscriptions_per_action,
              .max_total = config.max_total_subscriptions}),
      debounce_(loop, config, trace),
      cycles_(*this, loop.GetClock(), config, trace),
      listener_(tiers.AddListener([this](const storage::StorageChange& change) {
        OnStorageChange(change);
      })),
      pull_mode_(config.pull_mode) {
}

Scheduler::~Scheduler() {
  tiers_.RemoveListener(listener_);
  for (const auto& [id, action] : actions_) {
    debounce_.Forget(id);
  }
}

// =============================================================================
// Registration
// =============================================================================

auto Scheduler::Subscribe(
    ActionFn fn, ReactivityLog log, SubscribeOptions options) -> ActionId {
  ActionId id{.value = next_id_++};
  if (auto subscribed = graph_.Subscribe(id, log); !subscribed) {
    throw DiagnosticException(subscribed.error());
  }
  actions_.emplace(
      id, Action{
              .fn = std::move(fn),
              .kind = options.kind,
              .stats = {},
              .potential_writes = std::move(log.potential_writes),
          });

  if (options.debounce) {
    debounce_.SetDebounce(id, *options.debounce);
  }
  if (options.auto_debounce) {
    debounce_.SetAutoDebounce(id, *options.auto_debounce);
  }
  if (options.throttle) {
    debounce_.SetThrottle(id, *options.throttle);
  }

  GetLogger()->debug(
      "subscribe action {} ({})", id.value,
      options.kind == ActionKind::kEffect ? "effect" : "computation");

  if (options.schedule_immediately) {
    dirty_.insert(id);
    pending_.insert(id);
    QueueExecution();
  }
  return id;
}

void Scheduler::Resubscribe(ActionId id, ReactivityLog log) {
  Action& action = GetAction(id);
  if (!log.potential_writes.empty()) {
    action.potential_writes = log.potential_writes;
  } else {
    log.potential_writes = action.potential_writes;
  }
  if (auto subscribed = graph_.Subscribe(id, log); !subscribed) {
    Report(subscribed.error());
  }
}

void Scheduler::Unsubscribe(ActionId id) {
  if (!actions_.contains(id)) {
    return;
  }
  graph_.Unsubscribe(id);
  debounce_.Forget(id);
  cycles_.Forget(id);
  dirty_.erase(id);
  pending_.erase(id);
  in_flight_.erase(id);
  actions_.erase(id);
  GetLogger()->debug("unsubscribe action {}", id.value);
}

void Scheduler::MarkDirty(ActionId id) {
  if (!actions_.contains(id)) {
    common::ThrowInternalError(
        "Scheduler::MarkDirty", fmt::format("unknown action {}", id.value));
  }
  std::vector<ActionId> stack{id};
  while (!stack.empty()) {
    ActionId current = stack.back();
    stack.pop_back();
    if (!dirty_.insert(current).second) {
      continue;
    }
    for (ActionId dependent : graph_.Dependents(current)) {
      stack.push_back(dependent);
    }
  }
}

// =============================================================================
// Running
// =============================================================================

auto Scheduler::Run(ActionId id) -> Result<void> {
  GetAction(id);
  std::optional<ActionId> outer_target = std::exchange(run_target_, id);
  std::optional<Diagnostic> outer_failure = std::exchange(run_failure_, {});

  dirty_.insert(id);
  bool saw_cycle = false;
  auto work = CollectWork({id}, /*pull=*/true, saw_cycle);
  ProcessWorkSet(std::move(work), saw_cycle);

  std::optional<Diagnostic> failure = std::exchange(run_failure_, outer_failure);
  run_target_ = outer_target;
  if (!pending_.empty() || !events_.empty()) {
    QueueExecution();
  } else if (!outer_target && !running_) {
    // A host-driven run that left nothing behind counts as its own pass.
    ResetLoopCounts();
  }
  if (failure) {
    return std::unexpected(std::move(*failure));
  }
  return {};
}

void Scheduler::Execute() {
  ProcessEvent();

  std::vector<ActionId> roots(pending_.begin(), pending_.end());
  bool saw_cycle = false;
  auto work = CollectWork(roots, pull_mode_, saw_cycle);
  ProcessWorkSet(std::move(work), saw_cycle);

  if (!pending_.empty() || !events_.empty()) {
    QueueExecution();
    return;
  }
  // Idle: iteration limits count from here again.
  ResetLoopCounts();
}

void Scheduler::ResetLoopCounts() {
  for (auto& [id, action] : actions_) {
    action.loop_count = 0;
  }
}

void Scheduler::QueueExecution() {
  if (execution_queued_) {
    return;
  }
  execution_queued_ = true;
  std::weak_ptr<bool> alive = alive_;
  loop_.Post([this, alive] {
    if (alive.expired()) {
      return;
    }
    execution_queued_ = false;
    Execute();
  });
}

auto Scheduler::CollectWork(
    const std::vector<ActionId>& roots, bool pull, bool& saw_cycle)
    -> std::vector<ActionId> {
  std::vector<ActionId> order;
  absl::flat_hash_set<ActionId> visited;
  std::vector<ActionId> stack;

  std::function<void(ActionId)> visit = [&](ActionId node) {
    visited.insert(node);
    stack.push_back(node);
    if (pull) {
      for (ActionId dep : graph_.Dependencies(node)) {
        if (!dirty_.contains(dep) || !IsComputation(dep)) {
          continue;
        }
        auto on_stack = std::ranges::find(stack, dep);
        if (on_stack != stack.end()) {
          saw_cycle = true;
          GetLogger()->debug(
              "pull re-entered action {} ({} actions on the stack)", dep.value,
              static_cast<size_t>(stack.end() - on_stack));
          continue;
        }
        if (!visited.contains(dep)) {
          visit(dep);
        }
      }
    }
    stack.pop_back();
    order.push_back(node);
  };

  for (ActionId root : roots) {
    if (actions_.contains(root) && !visited.contains(root)) {
      visit(root);
    }
  }

  // A cycle paused on the slow path resumes as a whole, even if only some of
  // its members are dirty right now.
  for (const auto& members : cycles_.SlowCycles()) {
    bool touched = std::ranges::any_of(
        members, [&](ActionId m) { return visited.contains(m); });
    if (!touched) {
      continue;
    }
    saw_cycle = true;
    for (ActionId m : members) {
      if (visited.insert(m).second) {
        order.push_back(m);
      }
    }
  }
  return order;
}

void Scheduler::ProcessWorkSet(std::vector<ActionId> work, bool saw_cycle) {
  if (work.empty()) {
    return;
  }
  for (ActionId id : work) {
    pending_.erase(id);
    in_flight_.insert(id);
  }
  InFlightScope in_flight(in_flight_, work);

  EdgeMap edges = graph_.EdgesWithin(work);
  std::vector<std::vector<ActionId>> components;
  if (saw_cycle) {
    components = StronglyConnectedComponents(work, edges);
  } else {
    components.reserve(work.size());
    for (ActionId id : work) {
      components.push_back({id});
    }
  }

  // Order components by their smallest member, with edges lifted from the
  // members.
  absl::flat_hash_map<ActionId, ActionId> rep_of;
  absl::flat_hash_map<ActionId, size_t> component_of;
  std::vector<ActionId> reps;
  for (size_t i = 0; i < components.size(); ++i) {
    ActionId rep = components[i].front();
    reps.push_back(rep);
    component_of[rep] = i;
    for (ActionId member : components[i]) {
      rep_of[member] = rep;
    }
  }
  EdgeMap rep_edges;
  for (const auto& [from, targets] : edges) {
    for (ActionId to : targets) {
      ActionId a = rep_of[from];
      ActionId b = rep_of[to];
      if (a != b) {
        rep_edges[a].push_back(b);
      }
    }
  }

  absl::flat_hash_set<ActionId> deferred;
  for (ActionId rep : TopologicalOrder(reps, rep_edges)) {
    const auto& component = components[component_of[rep]];

    if (component.size() > 1) {
      // Everything downstream of the cycle within this work set.
      std::vector<ActionId> downstream;
      absl::flat_hash_set<ActionId> seen(component.begin(), component.end());
      std::vector<ActionId> frontier = component;
      while (!frontier.empty()) {
        ActionId node = frontier.back();
        frontier.pop_back();
        auto it = edges.find(node);
        if (it == edges.end()) {
          continue;
        }
        for (ActionId next : it->second) {
          if (seen.insert(next).second) {
            downstream.push_back(next);
            frontier.push_back(next);
          }
        }
      }
      std::ranges::sort(downstream);
      std::vector<ActionId> drivers;
      for (ActionId id : downstream) {
        if (IsEffect(id)) {
          drivers.push_back(id);
        }
      }

      CycleOutcome outcome = cycles_.Handle(component, drivers);
      for (ActionId member : component) {
        in_flight_.erase(member);
      }
      if (outcome == CycleOutcome::kYielded) {
        deferred.insert(downstream.begin(), downstream.end());
      }
      continue;
    }

    ActionId id = component.front();
    if (deferred.contains(id)) {
      // Waits for the cycle upstream of it; stays dirty and comes back next
      // tick.
      in_flight_.erase(id);
      if (actions_.contains(id)) {
        pending_.insert(id);
      }
      continue;
    }
    ExecuteOne(id);
  }
}

void Scheduler::ExecuteOne(ActionId id) {
  in_flight_.erase(id);
  auto it = actions_.find(id);
  if (it == actions_.end()) {
    return;
  }
  if (debounce_.ShouldSkip(id, it->second.stats)) {
    GetLogger()->debug("action {} throttled; left dirty", id.value);
    return;
  }
  RunAction(id);
}

auto Scheduler::RunAction(ActionId id) -> bool {
  Action& action = GetAction(id);
  if (++action.loop_count > config_.max_iterations_per_run) {
    Report(
        Diagnostic::Error(
            ErrorCode::kIterationLimitExceeded,
            fmt::format(
                "action {} ran more than {} times before the loop went idle",
                id.value, config_.max_iterations_per_run))
            .ForAction(id)
            .WithCount(config_.max_iterations_per_run));
    dirty_.erase(id);
    pending_.erase(id);
    return false;
  }

  // The closure may unsubscribe its own action; keep it alive for the call.
  ActionFn fn = action.fn;
  Clock& clock = loop_.GetClock();
  storage::Transaction tx(tiers_);
  std::optional<Diagnostic> failure;
  Result<void> committed;
  {
    RunningScope running(running_, id);
    Duration started = clock.Now();
    try {
      fn(tx);
    } catch (const DiagnosticException& e) {
      failure = e.GetDiagnostic();
    } catch (const std::exception& e) {
      failure = Diagnostic::Error(
          ErrorCode::kActionFailed,
          fmt::format("action {} threw: {}", id.value, e.what()));
    } catch (...) {
      failure = Diagnostic::Error(
          ErrorCode::kActionFailed,
          fmt::format("action {} threw a non-standard exception", id.value));
    }
    Duration elapsed = clock.Now() - started;

    if (!actions_.contains(id)) {
      tx.Abort();
      return false;
    }
    dirty_.erase(id);
    pending_.erase(id);
    RecordRun(id, started, elapsed);

    if (failure) {
      tx.Abort();
    } else {
      // Dependencies may differ from run to run; always re-capture.
      ReactivityLog log = tx.Log();
      log.potential_writes = GetAction(id).potential_writes;
      if (auto subscribed = graph_.Subscribe(id, log); !subscribed) {
        Report(subscribed.error());
      }

      std::weak_ptr<bool> alive = alive_;
      committed =
          tx.Commit([this, alive, id](const storage::CommitOutcome& outcome) {
            if (alive.expired()) {
              return;
            }
            OnCommitSettled(id, outcome);
          });
    }
  }

  if (failure) {
    Report(std::move(*failure).ForAction(id));
    return false;
  }
  if (!committed) {
    if (committed.error().code == ErrorCode::kCommitConflict) {
      HandleConflict(id, std::move(committed.error()));
    } else {
      Report(std::move(committed.error()).ForAction(id));
    }
  }
  return true;
}

void Scheduler::RecordRun(ActionId id, Duration started, Duration elapsed) {
  Action& action = GetAction(id);
  ActionStats& stats = action.stats;
  ++stats.run_count;
  stats.total_time += elapsed;
  stats.average_time = stats.total_time / static_cast<int64_t>(stats.run_count);
  stats.last_run_time = elapsed;
  stats.last_run_at = started;

  debounce_.RecordRun(id, stats);
  if (trace_ != nullptr) {
    trace_->EmitActionRun(id, action.kind == ActionKind::kEffect, elapsed);
  }
  GetLogger()->trace(
      "ran action {} in {:.3f}ms (run {})", id.value, ToMillis(elapsed),
      stats.run_count);
}

// =============================================================================
// Commits and conflicts
// =============================================================================

void Scheduler::OnCommitSettled(
    ActionId id, const storage::CommitOutcome& outcome) {
  if (trace_ != nullptr) {
    trace_->EmitCommitSettled(id, outcome.has_value());
  }
  if (outcome) {
    if (auto it = actions_.find(id); it != actions_.end()) {
      it->second.conflict_retries = 0;
    }
    return;
  }
  HandleConflict(
      id, Diagnostic::Error(
              ErrorCode::kCommitConflict,
              fmt::format(
                  "commit of action {} rejected on {}", id.value,
                  storage::ToString(outcome.error().entity))));
}

void Scheduler::HandleConflict(ActionId id, Diagnostic diag) {
  auto it = actions_.find(id);
  if (it == actions_.end()) {
    return;
  }
  Action& action = it->second;
  ++action.conflict_retries;
  Report(std::move(diag).ForAction(id).WithCount(action.conflict_retries));
  if (action.conflict_retries > config_.max_commit_retries) {
    GetLogger()->warn(
        "action {} gave up after {} rejected commits", id.value,
        config_.max_commit_retries);
    action.conflict_retries = 0;
    return;
  }
  dirty_.insert(id);
  pending_.insert(id);
  QueueExecution();
}

// =============================================================================
// Triggers
// =============================================================================

void Scheduler::OnStorageChange(const storage::StorageChange& change) {
  for (ActionId id : graph_.Triggered(change)) {
    if (running_ == id || !actions_.contains(id)) {
      continue;
    }
    MarkDirty(id);
    if (in_flight_.contains(id)) {
      continue;
    }
    if (!pull_mode_ || IsEffect(id)) {
      ScheduleEffect(id);
    } else {
      ScheduleAffectedEffects(id);
    }
  }
}

void Scheduler::ScheduleEffect(ActionId id) {
  std::weak_ptr<bool> alive = alive_;
  debounce_.Schedule(id, [this, alive, id] {
    if (alive.expired() || !actions_.contains(id)) {
      return;
    }
    dirty_.insert(id);
    pending_.insert(id);
    QueueExecution();
  });
}

void Scheduler::ScheduleAffectedEffects(ActionId id) {
  absl::flat_hash_set<ActionId> seen{id};
  std::vector<ActionId> stack{id};
  std::vector<ActionId> effects;
  while (!stack.empty()) {
    ActionId current = stack.back();
    stack.pop_back();
    for (ActionId dependent : graph_.Dependents(current)) {
      if (!seen.insert(dependent).second) {
        continue;
      }
      if (IsEffect(dependent)) {
        effects.push_back(dependent);
      }
      stack.push_back(dependent);
    }
  }
  std::ranges::sort(effects);
  for (ActionId effect : effects) {
    if (!in_flight_.contains(effect)) {
      ScheduleEffect(effect);
    }
  }
}

// =============================================================================
// Events
// =============================================================================

void Scheduler::QueueEvent(
    EventHandler handler, storage::Value event,
    storage::CommitCallback on_commit, std::optional<uint32_t> retries) {
  events_.push_back(
      QueuedEvent{
          .handler = std::move(handler),
          .event = std::move(event),
          .on_commit = std::move(on_commit),
          .retries_left = retries.value_or(config_.max_event_retries),
      });
  QueueExecution();
}

void Scheduler::ProcessEvent() {
  if (events_.empty()) {
    return;
  }
  auto queued = std::make_shared<QueuedEvent>(std::move(events_.front()));
  events_.pop_front();

  storage::Transaction tx(tiers_);
  std::optional<Diagnostic> failure;
  try {
    queued->handler(tx, queued->event);
  } catch (const DiagnosticException& e) {
    failure = e.GetDiagnostic();
  } catch (const std::exception& e) {
    failure = Diagnostic::Error(
        ErrorCode::kActionFailed,
        fmt::format("event handler threw: {}", e.what()));
  } catch (...) {
    failure = Diagnostic::Error(
        ErrorCode::kActionFailed,
        "event handler threw a non-standard exception");
  }
  if (failure) {
    tx.Abort();
    Report(std::move(*failure));
    return;
  }

  std::weak_ptr<bool> alive = alive_;
  storage::CommitCallback settle =
      [this, alive, queued](const storage::CommitOutcome& outcome) {
        if (alive.expired()) {
          return;
        }
        if (trace_ != nullptr) {
          trace_->EmitCommitSettled(ActionId{}, outcome.has_value());
        }
        if (!outcome && queued->retries_left > 0) {
          --queued->retries_left;
          GetLogger()->debug(
              "event commit rejected; retrying ({} left)",
              queued->retries_left);
          events_.push_front(std::move(*queued));
          QueueExecution();
          return;
        }
        if (!outcome) {
          Report(
              Diagnostic::Error(
                  ErrorCode::kCommitConflict,
                  fmt::format(
                      "event commit rejected on {}; out of retries",
                      storage::ToString(outcome.error().entity))));
        }
        if (queued->on_commit) {
          queued->on_commit(outcome);
        }
      };

  auto committed = tx.Commit(settle);
  if (!committed) {
    if (committed.error().code == ErrorCode::kCommitConflict) {
      settle(std::unexpected(storage::CommitConflict{}));
    } else {
      Report(std::move(committed.error()));
    }
  }
}

// =============================================================================
// Settings and queries
// =============================================================================

void Scheduler::OnError(ErrorHandler handler) {
  error_handlers_.push_back(std::move(handler));
}

void Scheduler::SetPullMode(bool pull) {
  pull_mode_ = pull;
}

void Scheduler::SetDebounce(ActionId id, Duration interval) {
  GetAction(id);
  debounce_.SetDebounce(id, interval);
}

void Scheduler::ClearDebounce(ActionId id) {
  GetAction(id);
  debounce_.ClearDebounce(id);
}

void Scheduler::SetAutoDebounce(ActionId id, bool enabled) {
  GetAction(id);
  debounce_.SetAutoDebounce(id, enabled);
}

void Scheduler::SetThrottle(ActionId id, Duration period) {
  GetAction(id);
  debounce_.SetThrottle(id, period);
}

void Scheduler::ClearThrottle(ActionId id) {
  GetAction(id);
  debounce_.ClearThrottle(id);
}

auto Scheduler::GetDebounce(ActionId id) const -> std::optional<Duration> {
  return debounce_.GetDebounce(id);
}

auto Scheduler::GetStats() const -> SchedulerStats {
  SchedulerStats stats{
      .effects = 0,
      .computations = 0,
      .pending = pending_.size(),
      .dirty = dirty_.size(),
  };
  for (const auto& [id, action] : actions_) {
    if (action.kind == ActionKind::kEffect) {
      ++stats.effects;
    } else {
      ++stats.computations;
    }
  }
  return stats;
}

auto Scheduler::GetActionStats(ActionId id) const -> const ActionStats& {
  return GetAction(id).stats;
}

auto Scheduler::IsDirty(ActionId id) const -> bool {
  return dirty_.contains(id);
}

auto Scheduler::IsPending(ActionId id) const -> bool {
  return pending_.contains(id);
}

auto Scheduler::IsEffect(ActionId id) const -> bool {
  auto it = actions_.find(id);
  return it != actions_.end() && it->second.kind == ActionKind::kEffect;
}

auto Scheduler::IsComputation(ActionId id) const -> bool {
  auto it = actions_.find(id);
  return it != actions_.end() && it->second.kind == ActionKind::kComputation;
}

auto Scheduler::Contains(ActionId id) const -> bool {
  return actions_.contains(id);
}

auto Scheduler::Dependents(ActionId id) const -> std::vector<ActionId> {
  GetAction(id);
  return graph_.Dependents(id);
}

void Scheduler::Report(Diagnostic diag) {
  if (diag.IsError()) {
    GetLogger()->error("{}", FormatDiagnostic(diag));
  } else {
    GetLogger()->warn("{}", FormatDiagnostic(diag));
  }
  if (run_target_ && diag.action == run_target_ && diag.IsError() &&
      !run_failure_) {
    run_failure_ = diag;
  }
  for (const auto& handler : error_handlers_) {
    handler(diag);
  }
  diagnostics_.Report(std::move(diag));
}

auto Scheduler::GetAction(ActionId id) -> Action& {
  auto it = actions_.find(id);
  if (it == actions_.end()) {
    common::ThrowInternalError(
        "Scheduler", fmt::format("unknown action {}", id.value));
  }
  return it->second;
}

auto Scheduler::GetAction(ActionId id) const -> const Action& {
  auto it = actions_.find(id);
  if (it == actions_.end()) {
    common::ThrowInternalError(
        "Scheduler", fmt::format("unknown action {}", id.value));
  }
  return it->second;
}

// =============================================================================
// Cycle host
// =============================================================================

void Scheduler::RunCycleMember(ActionId id) {
  RunAction(id);
}

void Scheduler::ClearDirty(ActionId id) {
  dirty_.erase(id);
}

auto Scheduler::AverageTime(ActionId id) const -> Duration {
  auto it = actions_.find(id);
  if (it == actions_.end()) {
    return Duration::zero();
  }
  return it->second.stats.average_time;
}

auto Scheduler::CycleEdges(const std::vector<ActionId>& members) const
    -> EdgeMap {
  return graph_.EdgesWithin(members);
}

void Scheduler::ReportCycle(Diagnostic diag) {
  Report(std::move(diag));
}

}  // namespace ripple::runtime
