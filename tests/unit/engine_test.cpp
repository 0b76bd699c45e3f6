#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ripple/common/diagnostic.hpp"
#include "ripple/config/engine_config.hpp"
#include "ripple/runtime/action.hpp"
#include "ripple/runtime/clock.hpp"
#include "ripple/runtime/engine.hpp"
#include "ripple/storage/address.hpp"
#include "ripple/storage/in_memory_remote.hpp"
#include "ripple/storage/transaction.hpp"

namespace ripple::runtime {
namespace {

namespace fs = std::filesystem;
using storage::Address;
using storage::Transaction;

class EngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("ripple_engine_test_" +
            std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    fs::remove_all(dir_);
  }

  auto MakeEngine(config::EngineConfig config) -> std::unique_ptr<Engine> {
    auto engine =
        Engine::Create(remote_, std::move(config), std::make_unique<ManualClock>());
    EXPECT_TRUE(engine.has_value()) << FormatDiagnostic(engine.error());
    return engine ? std::move(*engine) : nullptr;
  }

  static auto Addr(const char* entity) -> Address {
    return Address{.space = "space1", .entity = entity, .path = {"v"}};
  }

  fs::path dir_;
  storage::InMemoryRemoteStore remote_;
};

TEST_F(EngineTest, DefaultsUseMemoryCacheAndNoTrace) {
  auto engine = MakeEngine({});
  ASSERT_NE(engine, nullptr);
  EXPECT_EQ(engine->GetCache().Size(), 0U);
  EXPECT_FALSE(engine->GetTrace().IsEnabled());
  EXPECT_FALSE(engine->GetScheduler().IsPullMode());
  EXPECT_EQ(engine->GetClock().Now(), Duration::zero());
}

TEST_F(EngineTest, UnknownLogLevelIsConfigError) {
  config::EngineConfig config;
  config.log_level = "chatty";
  auto engine = Engine::Create(remote_, config);
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error().code, ErrorCode::kConfigError);
}

TEST_F(EngineTest, PullModeFromConfig) {
  config::EngineConfig config;
  config.pull_mode = true;
  auto engine = MakeEngine(config);
  ASSERT_NE(engine, nullptr);
  EXPECT_TRUE(engine->GetScheduler().IsPullMode());
}

TEST_F(EngineTest, EffectSeesWritesAndTraceSummarizes) {
  config::EngineConfig config;
  config.trace = true;
  auto engine = MakeEngine(config);
  ASSERT_NE(engine, nullptr);

  std::vector<int> seen;
  ActionId effect = engine->GetScheduler().Subscribe(
      [&](Transaction& tx) { seen.push_back(tx.ReadOr(Addr("in"), -1)); },
      ReactivityLog{.reads = {Addr("in")}},
      SubscribeOptions{
          .kind = ActionKind::kEffect, .schedule_immediately = true});
  engine->RunUntilIdle();
  ASSERT_TRUE(engine->GetTiers().Set(Addr("in"), 2).has_value());
  engine->RunUntilIdle();

  EXPECT_EQ(seen, (std::vector<int>{-1, 2}));
  EXPECT_EQ(engine->GetTrace().CountRuns(effect), 2U);
  EXPECT_NE(
      engine->GetTrace().Summary().find("ripple-trace: runs=2"),
      std::string::npos);
  EXPECT_FALSE(engine->GetDiagnostics().HasErrors());
}

TEST_F(EngineTest, CachePathPersistsConfirmedFacts) {
  config::EngineConfig config;
  config.cache_path = dir_ / "facts.jsonl";
  {
    auto engine = MakeEngine(config);
    ASSERT_NE(engine, nullptr);
    ASSERT_TRUE(engine->GetTiers().Set(Addr("in"), 5).has_value());
    EXPECT_EQ(engine->GetCache().Size(), 1U);
  }
  EXPECT_TRUE(fs::exists(dir_ / "facts.jsonl"));

  auto reopened = MakeEngine(config);
  ASSERT_NE(reopened, nullptr);
  EXPECT_EQ(reopened->GetCache().Size(), 1U);
}

TEST_F(EngineTest, CorruptCacheFailsCreate) {
  {
    std::ofstream out(dir_ / "facts.jsonl");
    out << "{not json\n";
  }
  config::EngineConfig config;
  config.cache_path = dir_ / "facts.jsonl";
  auto engine = Engine::Create(remote_, config);
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error().code, ErrorCode::kStoreError);
}

}  // namespace
}  // namespace ripple::runtime
