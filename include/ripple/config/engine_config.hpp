#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "ripple/common/diagnostic.hpp"

namespace ripple::config {

struct EngineConfig {
  // [scheduler]
  bool pull_mode = false;
  uint32_t max_iterations_per_run = 100;
  uint32_t max_cycle_iterations = 20;
  std::chrono::milliseconds fast_cycle_threshold{16};
  uint32_t max_commit_retries = 10;
  uint32_t max_event_retries = 5;
  uint32_t max_subscriptions_per_action = 4096;
  uint32_t max_total_subscriptions = 1U << 20;

  // [debounce]
  bool auto_debounce = true;
  std::chrono::milliseconds auto_debounce_threshold{50};
  uint32_t auto_debounce_min_runs = 5;
  std::chrono::milliseconds max_auto_debounce{200};

  // [storage]
  std::optional<std::filesystem::path> cache_path;

  // [log]
  std::string log_level = "warn";
  bool trace = false;
};

// Search for ripple.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse ripple.toml. Missing keys keep their defaults; a relative cache path
// is resolved against the file's directory.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<EngineConfig>;

// Parse TOML text. `source` names the input in diagnostics.
auto ParseConfig(std::string_view text, std::string_view source)
    -> Result<EngineConfig>;

}  // namespace ripple::config
