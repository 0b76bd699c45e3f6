#include <gtest/gtest.h>

#include <cstdint>
#include <utility>
#include <vector>

#include "ripple/common/diagnostic.hpp"
#include "ripple/common/ids.hpp"
#include "ripple/common/internal_error.hpp"
#include "ripple/runtime/dependency_graph.hpp"
#include "ripple/storage/in_memory_remote.hpp"
#include "ripple/storage/reactivity_log.hpp"
#include "ripple/storage/tier_manager.hpp"
#include "ripple/storage/transaction.hpp"

namespace ripple::runtime {
namespace {

using storage::Address;
using storage::ChangeKind;
using storage::EntityKey;
using storage::Path;
using storage::ReactivityLog;
using storage::StorageChange;
using storage::Value;

class DependencyGraphTest : public ::testing::Test {
 protected:
  static auto Id(uint32_t value) -> ActionId {
    return ActionId{.value = value};
  }
  static auto Addr(const char* entity, Path path = {}) -> Address {
    return Address{.space = "s", .entity = entity, .path = std::move(path)};
  }
  static auto Log(std::vector<Address> reads, std::vector<Address> writes)
      -> ReactivityLog {
    return ReactivityLog{.reads = std::move(reads), .writes = std::move(writes)};
  }
  static auto Change(const char* entity, Value before, Value after)
      -> StorageChange {
    return StorageChange{
        .kind = ChangeKind::kIntegrate,
        .entity = EntityKey{.space = "s", .entity = entity},
        .before = std::move(before),
        .after = std::move(after)};
  }

  void MustSubscribe(ActionId id, const ReactivityLog& log) {
    auto result = graph_.Subscribe(id, log);
    ASSERT_TRUE(result.has_value()) << FormatDiagnostic(result.error());
  }

  DependencyGraph graph_;
};

// ============================================================================
// Edges
// ============================================================================

TEST_F(DependencyGraphTest, WriterFeedsOverlappingReader) {
  MustSubscribe(Id(0), Log({}, {Addr("e1", {"count"})}));
  MustSubscribe(Id(1), Log({Addr("e1")}, {}));
  MustSubscribe(Id(2), Log({Addr("e1", {"other"})}, {}));

  EXPECT_EQ(graph_.Dependents(Id(0)), std::vector<ActionId>{Id(1)});
  EXPECT_EQ(graph_.Dependencies(Id(1)), std::vector<ActionId>{Id(0)});
  EXPECT_TRUE(graph_.Dependencies(Id(2)).empty());
}

TEST_F(DependencyGraphTest, EdgesFormRegardlessOfSubscribeOrder) {
  MustSubscribe(Id(1), Log({Addr("e1", {"a"})}, {}));
  MustSubscribe(Id(0), Log({}, {Addr("e1", {"a", "b"})}));
  EXPECT_EQ(graph_.Dependents(Id(0)), std::vector<ActionId>{Id(1)});
}

TEST_F(DependencyGraphTest, NoSelfEdges) {
  MustSubscribe(Id(0), Log({Addr("e1")}, {Addr("e1")}));
  EXPECT_TRUE(graph_.Dependents(Id(0)).empty());
  EXPECT_TRUE(graph_.Dependencies(Id(0)).empty());
}

TEST_F(DependencyGraphTest, ResubscribeReplacesReads) {
  MustSubscribe(Id(0), Log({}, {Addr("e1")}));
  MustSubscribe(Id(1), Log({Addr("e1")}, {}));
  MustSubscribe(Id(1), Log({Addr("e2")}, {}));

  EXPECT_TRUE(graph_.Dependents(Id(0)).empty());
  EXPECT_EQ(graph_.GetLog(Id(1)).reads, std::vector<Address>{Addr("e2")});
}

TEST_F(DependencyGraphTest, MightWriteOnlyGrows) {
  MustSubscribe(Id(0), Log({}, {Addr("e1")}));
  MustSubscribe(Id(1), Log({Addr("e1")}, {}));
  // A later run that happens not to write keeps the old edge.
  MustSubscribe(Id(0), Log({}, {}));

  EXPECT_EQ(graph_.MightWrite(Id(0)), std::vector<Address>{Addr("e1")});
  EXPECT_EQ(graph_.Dependents(Id(0)), std::vector<ActionId>{Id(1)});
}

TEST_F(DependencyGraphTest, PotentialWritesCreateEdges) {
  ReactivityLog log;
  log.potential_writes = {Addr("e9")};
  MustSubscribe(Id(0), log);
  MustSubscribe(Id(1), Log({Addr("e9", {"x"})}, {}));
  EXPECT_EQ(graph_.Dependents(Id(0)), std::vector<ActionId>{Id(1)});
}

TEST_F(DependencyGraphTest, UnsubscribeRemovesEdgesBothWays) {
  MustSubscribe(Id(0), Log({}, {Addr("e1")}));
  MustSubscribe(Id(1), Log({Addr("e1")}, {Addr("e2")}));
  MustSubscribe(Id(2), Log({Addr("e2")}, {}));

  graph_.Unsubscribe(Id(1));
  EXPECT_FALSE(graph_.Contains(Id(1)));
  EXPECT_TRUE(graph_.Dependents(Id(0)).empty());
  EXPECT_TRUE(graph_.Dependencies(Id(2)).empty());
  EXPECT_EQ(graph_.Size(), 2U);
}

TEST_F(DependencyGraphTest, UnknownActionIsInternalError) {
  EXPECT_THROW((void)graph_.Dependents(Id(42)), common::InternalError);
}

TEST_F(DependencyGraphTest, EdgesWithinRestrictsToNodeSet) {
  MustSubscribe(Id(0), Log({}, {Addr("e1")}));
  MustSubscribe(Id(1), Log({Addr("e1")}, {}));
  MustSubscribe(Id(2), Log({Addr("e1")}, {}));

  auto edges = graph_.EdgesWithin({Id(0), Id(2)});
  ASSERT_TRUE(edges.contains(Id(0)));
  EXPECT_EQ(edges[Id(0)], std::vector<ActionId>{Id(2)});
}

// ============================================================================
// Triggering
// ============================================================================

TEST_F(DependencyGraphTest, TriggeredOnlyWhenReadPathChanges) {
  MustSubscribe(Id(0), Log({Addr("e1", {"a"})}, {}));
  MustSubscribe(Id(1), Log({Addr("e1", {"b"})}, {}));
  MustSubscribe(Id(2), Log({Addr("e2")}, {}));

  auto triggered = graph_.Triggered(
      Change("e1", Value{{"a", 1}, {"b", 2}}, Value{{"a", 1}, {"b", 3}}));
  EXPECT_EQ(triggered, std::vector<ActionId>{Id(1)});
}

TEST_F(DependencyGraphTest, UnknownEntityTriggersNothing) {
  MustSubscribe(Id(0), Log({Addr("e1")}, {}));
  EXPECT_TRUE(graph_.Triggered(Change("zz", 1, 2)).empty());
}

// ============================================================================
// Limits and capture
// ============================================================================

TEST_F(DependencyGraphTest, PerActionLimitRejectsAndKeepsOldLog) {
  DependencyGraph graph(SubscriptionLimits{.max_per_action = 2});
  ASSERT_TRUE(graph.Subscribe(Id(0), Log({Addr("e1")}, {})).has_value());

  auto result = graph.Subscribe(
      Id(0), Log({Addr("e1"), Addr("e2"), Addr("e3")}, {}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kSubscriptionLimit);
  EXPECT_EQ(result.error().action, Id(0));
  EXPECT_EQ(graph.GetLog(Id(0)).reads, std::vector<Address>{Addr("e1")});
  EXPECT_EQ(graph.TotalSubscriptions(), 1U);
}

TEST_F(DependencyGraphTest, TotalLimitCountsAllActions) {
  DependencyGraph graph(SubscriptionLimits{.max_total = 3});
  ASSERT_TRUE(
      graph.Subscribe(Id(0), Log({Addr("e1"), Addr("e2")}, {})).has_value());
  auto result = graph.Subscribe(Id(1), Log({Addr("e3"), Addr("e4")}, {}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kSubscriptionLimit);
  EXPECT_FALSE(graph.Contains(Id(1)));
}

TEST_F(DependencyGraphTest, CompactionCoversNestedPaths) {
  MustSubscribe(
      Id(0), Log({Addr("e1", {"a", "b"}), Addr("e1", {"a"}), Addr("e1", {"a"})},
                 {}));
  EXPECT_EQ(graph_.GetLog(Id(0)).reads, std::vector<Address>{Addr("e1", {"a"})});
  EXPECT_EQ(graph_.TotalSubscriptions(), 1U);
}

TEST_F(DependencyGraphTest, CaptureReturnsTransactionLog) {
  storage::InMemoryRemoteStore remote;
  storage::TierManager tiers(remote);
  storage::Transaction tx(tiers);

  auto log = DependencyGraph::Capture(
      [](storage::Transaction& t) {
        auto n = t.ReadOr(Addr("in", {"n"}), 0);
        t.Write(Addr("out", {"n"}), n + 1);
      },
      tx);
  EXPECT_EQ(log.reads, std::vector<Address>{Addr("in", {"n"})});
  EXPECT_EQ(log.writes, std::vector<Address>{Addr("out", {"n"})});
}

}  // namespace
}  // namespace ripple::runtime
