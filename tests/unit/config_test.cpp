#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "ripple/config/engine_config.hpp"

namespace ripple::config {
namespace {

namespace fs = std::filesystem;
using std::chrono::milliseconds;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("ripple_config_test_" +
            std::string(
                ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_ / "nested" / "deeper");
  }

  void TearDown() override {
    fs::remove_all(dir_);
  }

  void WriteConfig(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
  }

  fs::path dir_;
};

TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
  auto config = ParseConfig("", "inline");
  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(config->pull_mode);
  EXPECT_EQ(config->max_iterations_per_run, 100);
  EXPECT_EQ(config->max_cycle_iterations, 20);
  EXPECT_EQ(config->fast_cycle_threshold, milliseconds(16));
  EXPECT_EQ(config->max_commit_retries, 10);
  EXPECT_EQ(config->max_event_retries, 5);
  EXPECT_TRUE(config->auto_debounce);
  EXPECT_EQ(config->auto_debounce_threshold, milliseconds(50));
  EXPECT_EQ(config->auto_debounce_min_runs, 5);
  EXPECT_EQ(config->max_auto_debounce, milliseconds(200));
  EXPECT_FALSE(config->cache_path.has_value());
  EXPECT_EQ(config->log_level, "warn");
  EXPECT_FALSE(config->trace);
}

TEST_F(ConfigTest, SectionsOverrideDefaults) {
  auto config = ParseConfig(
      R"(
[scheduler]
pull_mode = true
max_iterations_per_run = 50
max_cycle_iterations = 8
fast_cycle_threshold_ms = 4

[debounce]
auto = false
threshold_ms = 30
min_runs = 2
max_ms = 500

[storage]
cache_path = "/tmp/facts.jsonl"

[log]
level = "debug"
trace = true
)",
      "inline");
  ASSERT_TRUE(config.has_value()) << FormatDiagnostic(config.error());
  EXPECT_TRUE(config->pull_mode);
  EXPECT_EQ(config->max_iterations_per_run, 50);
  EXPECT_EQ(config->max_cycle_iterations, 8);
  EXPECT_EQ(config->fast_cycle_threshold, milliseconds(4));
  EXPECT_FALSE(config->auto_debounce);
  EXPECT_EQ(config->auto_debounce_threshold, milliseconds(30));
  EXPECT_EQ(config->auto_debounce_min_runs, 2);
  EXPECT_EQ(config->max_auto_debounce, milliseconds(500));
  ASSERT_TRUE(config->cache_path.has_value());
  EXPECT_EQ(*config->cache_path, fs::path("/tmp/facts.jsonl"));
  EXPECT_EQ(config->log_level, "debug");
  EXPECT_TRUE(config->trace);
}

TEST_F(ConfigTest, WrongTypeIsConfigError) {
  auto config = ParseConfig("[scheduler]\npull_mode = \"yes\"\n", "inline");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().code, ErrorCode::kConfigError);
  EXPECT_NE(config.error().primary.message.find("scheduler.pull_mode"),
            std::string::npos);
}

TEST_F(ConfigTest, ZeroIterationLimitIsRejected) {
  auto config =
      ParseConfig("[scheduler]\nmax_iterations_per_run = 0\n", "inline");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().code, ErrorCode::kConfigError);
}

TEST_F(ConfigTest, UnknownLogLevelIsRejected) {
  auto config = ParseConfig("[log]\nlevel = \"loud\"\n", "inline");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().code, ErrorCode::kConfigError);
}

TEST_F(ConfigTest, SyntaxErrorIsConfigError) {
  auto config = ParseConfig("[scheduler\n", "broken.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().code, ErrorCode::kConfigError);
  EXPECT_NE(config.error().primary.message.find("broken.toml"),
            std::string::npos);
}

TEST_F(ConfigTest, FindConfigWalksUpParents) {
  WriteConfig(dir_ / "ripple.toml", "");
  auto found = FindConfig(dir_ / "nested" / "deeper");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(dir_ / "ripple.toml"));
}

TEST_F(ConfigTest, LoadConfigResolvesRelativeCachePath) {
  WriteConfig(
      dir_ / "ripple.toml", "[storage]\ncache_path = \"state/facts.jsonl\"\n");
  auto config = LoadConfig(dir_ / "ripple.toml");
  ASSERT_TRUE(config.has_value()) << FormatDiagnostic(config.error());
  ASSERT_TRUE(config->cache_path.has_value());
  EXPECT_EQ(*config->cache_path, dir_ / "state/facts.jsonl");
}

TEST_F(ConfigTest, LoadConfigMissingFileIsConfigError) {
  auto config = LoadConfig(dir_ / "absent.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(config.error().code, ErrorCode::kConfigError);
}

}  // namespace
}  // namespace ripple::config
