#include <gtest/gtest.h>

#include <optional>
#include <utility>
#include <vector>

#include "ripple/common/diagnostic.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/fact.hpp"
#include "ripple/storage/value.hpp"

namespace ripple::storage {
namespace {

class AddressTest : public ::testing::Test {
 protected:
  static auto Addr(const char* entity, Path path) -> Address {
    return Address{.space = "space1", .entity = entity, .path = std::move(path)};
  }
};

// =============================================================================
// Overlap
// =============================================================================

TEST_F(AddressTest, PrefixPathsOverlap) {
  EXPECT_TRUE(Overlaps(Addr("e1", {"a"}), Addr("e1", {"a", "b"})));
  EXPECT_TRUE(Overlaps(Addr("e1", {"a", "b"}), Addr("e1", {"a"})));
  EXPECT_TRUE(Overlaps(Addr("e1", {}), Addr("e1", {"x", "y"})));
  EXPECT_TRUE(Overlaps(Addr("e1", {"a"}), Addr("e1", {"a"})));
}

TEST_F(AddressTest, SiblingPathsDoNotOverlap) {
  EXPECT_FALSE(Overlaps(Addr("e1", {"a", "b"}), Addr("e1", {"a", "c"})));
  EXPECT_FALSE(Overlaps(Addr("e1", {"ab"}), Addr("e1", {"a"})));
}

TEST_F(AddressTest, DifferentEntityOrSpaceNeverOverlaps) {
  EXPECT_FALSE(Overlaps(Addr("e1", {}), Addr("e2", {})));
  Address other = Addr("e1", {});
  other.space = "space2";
  EXPECT_FALSE(Overlaps(Addr("e1", {}), other));
}

TEST_F(AddressTest, AnyOverlapChecksAllPairs) {
  std::vector<Address> writes = {Addr("e1", {"x"}), Addr("e2", {"y"})};
  EXPECT_TRUE(AnyOverlap(writes, {Addr("e2", {"y", "z"})}));
  EXPECT_FALSE(AnyOverlap(writes, {Addr("e3", {})}));
  EXPECT_FALSE(AnyOverlap({}, writes));
}

// =============================================================================
// Compaction
// =============================================================================

TEST_F(AddressTest, CompactionDropsCoveredPaths) {
  auto compacted = SortAndCompact({
      Addr("e1", {"a", "b"}),
      Addr("e1", {"a"}),
      Addr("e1", {"a", "c", "d"}),
      Addr("e1", {"b"}),
  });
  ASSERT_EQ(compacted.size(), 2);
  EXPECT_EQ(compacted[0], Addr("e1", {"a"}));
  EXPECT_EQ(compacted[1], Addr("e1", {"b"}));
}

TEST_F(AddressTest, CompactionKeepsDistinctEntities) {
  auto compacted = SortAndCompact({
      Addr("e2", {"a"}),
      Addr("e1", {"a"}),
      Addr("e1", {"a"}),
  });
  ASSERT_EQ(compacted.size(), 2);
  EXPECT_EQ(compacted[0].entity, "e1");
  EXPECT_EQ(compacted[1].entity, "e2");
}

TEST_F(AddressTest, WholeEntityAbsorbsEverything) {
  auto compacted = SortAndCompact({
      Addr("e1", {"z"}),
      Addr("e1", {}),
      Addr("e1", {"a", "b"}),
  });
  ASSERT_EQ(compacted.size(), 1);
  EXPECT_TRUE(compacted[0].path.empty());
}

TEST_F(AddressTest, ToStringJoinsPath) {
  EXPECT_EQ(ToString(Addr("e1", {"a", "b"})), "space1/e1/a/b");
  EXPECT_EQ(ToString(Addr("e1", {})), "space1/e1");
}

// =============================================================================
// Values
// =============================================================================

TEST_F(AddressTest, GetAtPathWalksObjectsAndArrays) {
  std::optional<Value> root = Value::parse(R"({"a": {"b": [10, 20]}})");
  EXPECT_EQ(GetAtPath(root, {"a", "b", "1"}), Value(20));
  EXPECT_EQ(GetAtPath(root, {"a", "missing"}), std::nullopt);
  EXPECT_EQ(GetAtPath(root, {"a", "b", "7"}), std::nullopt);
  EXPECT_EQ(GetAtPath(std::nullopt, {}), std::nullopt);
  EXPECT_EQ(GetAtPath(root, {}), root);
}

TEST_F(AddressTest, SetAtPathCreatesIntermediateObjects) {
  std::optional<Value> root;
  SetAtPath(root, {"a", "b"}, 5);
  ASSERT_TRUE(root.has_value());
  EXPECT_EQ((*root)["a"]["b"], 5);

  SetAtPath(root, {"a", "c"}, "x");
  EXPECT_EQ((*root)["a"]["b"], 5);
  EXPECT_EQ((*root)["a"]["c"], "x");

  SetAtPath(root, {}, Value(1));
  EXPECT_EQ(*root, Value(1));
}

TEST_F(AddressTest, SetAtPathAppendsOnePastTheEnd) {
  std::optional<Value> root = Value::parse("[1]");
  SetAtPath(root, {"1"}, 3);
  EXPECT_EQ(*root, Value::parse("[1, 3]"));
  SetAtPath(root, {"0"}, 5);
  EXPECT_EQ(*root, Value::parse("[5, 3]"));
  SetAtPath(root, {"2", "name"}, "x");
  EXPECT_EQ(*root, Value::parse(R"([5, 3, {"name": "x"}])"));
}

TEST_F(AddressTest, SetAtPathRejectsIndexFarPastTheEnd) {
  std::optional<Value> root = Value::parse(R"({"items": [1, 2]})");
  try {
    SetAtPath(root, {"items", "4000000000"}, 1);
    FAIL() << "expected a store error";
  } catch (const DiagnosticException& e) {
    EXPECT_EQ(e.GetDiagnostic().code, ErrorCode::kStoreError);
  }
  EXPECT_EQ(*root, Value::parse(R"({"items": [1, 2]})"));
}

TEST_F(AddressTest, SetAtPathRejectsNamedStepIntoArray) {
  std::optional<Value> root = Value::parse(R"({"items": [1, 2]})");
  try {
    SetAtPath(root, {"items", "name", "x"}, 1);
    FAIL() << "expected a store error";
  } catch (const DiagnosticException& e) {
    EXPECT_EQ(e.GetDiagnostic().code, ErrorCode::kStoreError);
  }
  EXPECT_EQ(*root, Value::parse(R"({"items": [1, 2]})"));
}

// =============================================================================
// Facts
// =============================================================================

TEST_F(AddressTest, FactRefIgnoresSince) {
  EntityKey key{.space = "space1", .entity = "e1"};
  Fact a = MakeFact(key, Value(1), std::nullopt);
  Fact b = a;
  b.since = 42;
  EXPECT_EQ(a.Ref(), b.Ref());
}

TEST_F(AddressTest, FactRefDependsOnValueAndCause) {
  EntityKey key{.space = "space1", .entity = "e1"};
  Fact a = MakeFact(key, Value(1), std::nullopt);
  Fact b = MakeFact(key, Value(2), std::nullopt);
  Fact c = MakeFact(key, Value(1), a.Ref());
  Fact retraction = MakeFact(key, std::nullopt, std::nullopt);
  EXPECT_NE(a.Ref(), b.Ref());
  EXPECT_NE(a.Ref(), c.Ref());
  EXPECT_NE(a.Ref(), retraction.Ref());
}

TEST_F(AddressTest, FactJsonRecordRestoresFact) {
  EntityKey key{.space = "space1", .entity = "e1"};
  Fact fact = MakeFact(key, Value::parse(R"({"count": 5})"), FactRef{"abc"});
  fact.since = 7;
  auto restored = FactFromJson(FactToJson(fact));
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(*restored, fact);
  EXPECT_EQ(restored->since, 7);
}

TEST_F(AddressTest, MalformedFactRecordIsStoreError) {
  auto restored = FactFromJson(Value::parse(R"({"space": 1})"));
  ASSERT_FALSE(restored.has_value());
  EXPECT_EQ(restored.error().code, ErrorCode::kStoreError);
}

}  // namespace
}  // namespace ripple::storage
