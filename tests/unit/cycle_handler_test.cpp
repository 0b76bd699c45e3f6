#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "ripple/common/diagnostic.hpp"
#include "ripple/common/ids.hpp"
#include "ripple/config/engine_config.hpp"
#include "ripple/runtime/clock.hpp"
#include "ripple/runtime/cycle_handler.hpp"
#include "ripple/trace/trace_manager.hpp"

namespace ripple::runtime {
namespace {

using std::chrono::milliseconds;

// Two actions feeding each other. Running 1 re-dirties 0 while `rounds` is
// positive; running 0 always dirties 1.
class PingPongHost : public CycleHost {
 public:
  explicit PingPongHost(ManualClock& clock) : clock_(clock) {
  }

  void RunCycleMember(ActionId id) override {
    ++runs[id];
    dirty.erase(id);
    clock_.Advance(cost_per_run);
    if (id.value == 0) {
      dirty.insert(ActionId{.value = 1});
    } else if (rounds > 0) {
      --rounds;
      dirty.insert(ActionId{.value = 0});
    }
  }
  [[nodiscard]] auto IsDirty(ActionId id) const -> bool override {
    return dirty.contains(id);
  }
  void ClearDirty(ActionId id) override {
    dirty.erase(id);
  }
  [[nodiscard]] auto AverageTime(ActionId /*id*/) const -> Duration override {
    return average;
  }
  [[nodiscard]] auto CycleEdges(const std::vector<ActionId>& /*members*/) const
      -> EdgeMap override {
    EdgeMap edges;
    edges[ActionId{.value = 0}] = {ActionId{.value = 1}};
    edges[ActionId{.value = 1}] = {ActionId{.value = 0}};
    return edges;
  }
  void ReportCycle(Diagnostic diag) override {
    reported.push_back(std::move(diag));
  }

  absl::btree_set<ActionId> dirty;
  absl::flat_hash_map<ActionId, uint32_t> runs;
  uint32_t rounds = 0;
  Duration cost_per_run{0};
  Duration average{0};
  std::vector<Diagnostic> reported;

 private:
  ManualClock& clock_;
};

class CycleHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    trace_.SetEnabled(true);
    host_.dirty = {kA, kB};
  }

  static constexpr ActionId kA{.value = 0};
  static constexpr ActionId kB{.value = 1};
  static constexpr ActionId kDriver{.value = 7};

  ManualClock clock_;
  config::EngineConfig config_;
  trace::TraceManager trace_;
  PingPongHost host_{clock_};
  CycleHandler handler_{host_, clock_, config_, &trace_};
  std::vector<ActionId> members_ = {kB, kA};
};

// ============================================================================
// Fast cycles
// ============================================================================

TEST_F(CycleHandlerTest, FastCycleConvergesWithinOneCall) {
  host_.rounds = 2;
  EXPECT_EQ(handler_.Handle(members_, {kDriver}), CycleOutcome::kConverged);
  EXPECT_TRUE(host_.dirty.empty());
  EXPECT_EQ(host_.runs[kA], 3U);
  EXPECT_EQ(host_.runs[kB], 3U);
  EXPECT_TRUE(host_.reported.empty());
  EXPECT_TRUE(handler_.SlowCycles().empty());
  EXPECT_EQ(trace_.CountCycles(CycleOutcome::kConverged), 1U);
}

TEST_F(CycleHandlerTest, FastCycleGivesUpAfterIterationLimit) {
  config_.max_cycle_iterations = 4;
  host_.rounds = 1000;
  EXPECT_EQ(handler_.Handle(members_, {kDriver}), CycleOutcome::kNotConverged);
  EXPECT_EQ(host_.runs[kA], 4U);
  EXPECT_TRUE(host_.dirty.empty());
  ASSERT_EQ(host_.reported.size(), 1U);
  const Diagnostic& diag = host_.reported.front();
  EXPECT_EQ(diag.code, ErrorCode::kCycleNotConverged);
  EXPECT_FALSE(diag.IsError());
  EXPECT_EQ(diag.action, kDriver);
  EXPECT_EQ(diag.count, 4U);
}

TEST_F(CycleHandlerTest, ExpensivePassDemotesToSlow) {
  host_.rounds = 5;
  host_.cost_per_run = milliseconds(10);
  EXPECT_EQ(handler_.Handle(members_, {kDriver}), CycleOutcome::kYielded);
  EXPECT_EQ(host_.runs[kA], 1U);
  auto slow = handler_.SlowCycles();
  ASSERT_EQ(slow.size(), 1U);
  EXPECT_EQ(slow[0], (std::vector<ActionId>{kA, kB}));
}

// ============================================================================
// Slow cycles
// ============================================================================

TEST_F(CycleHandlerTest, SlowCycleRunsOnePassPerCall) {
  host_.average = milliseconds(10);
  host_.rounds = 2;

  EXPECT_EQ(handler_.EstimateCost(members_), milliseconds(20));
  EXPECT_EQ(handler_.Handle(members_, {kDriver}), CycleOutcome::kYielded);
  EXPECT_EQ(host_.runs[kA], 1U);
  EXPECT_EQ(handler_.Handle(members_, {kDriver}), CycleOutcome::kYielded);
  EXPECT_EQ(host_.runs[kA], 2U);
  EXPECT_EQ(handler_.Handle(members_, {kDriver}), CycleOutcome::kConverged);
  EXPECT_EQ(host_.runs[kA], 3U);
  EXPECT_TRUE(handler_.SlowCycles().empty());
  EXPECT_TRUE(host_.reported.empty());
}

TEST_F(CycleHandlerTest, SlowCycleTimesOutPerDriver) {
  config_.max_iterations_per_run = 3;
  host_.average = milliseconds(10);
  host_.rounds = 1000;
  constexpr ActionId kOther{.value = 9};

  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(handler_.Handle(members_, {kDriver}), CycleOutcome::kYielded);
  }
  EXPECT_EQ(handler_.Handle(members_, {kOther}), CycleOutcome::kTimedOut);

  EXPECT_TRUE(handler_.SlowCycles().empty());
  EXPECT_TRUE(host_.dirty.empty());
  ASSERT_EQ(host_.reported.size(), 2U);
  EXPECT_EQ(host_.reported[0].code, ErrorCode::kSlowCycleTimeout);
  EXPECT_EQ(host_.reported[0].action, kDriver);
  EXPECT_EQ(host_.reported[1].action, kOther);
  EXPECT_EQ(host_.reported[1].count, 3U);
  EXPECT_EQ(trace_.CountCycles(CycleOutcome::kTimedOut), 1U);
}

TEST_F(CycleHandlerTest, ForgetDropsSlowRecord) {
  host_.average = milliseconds(10);
  host_.rounds = 1000;
  EXPECT_EQ(handler_.Handle(members_, {}), CycleOutcome::kYielded);
  handler_.Forget(kB);
  EXPECT_TRUE(handler_.SlowCycles().empty());
}

}  // namespace
}  // namespace ripple::runtime
