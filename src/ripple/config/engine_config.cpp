#include "ripple/config/engine_config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace ripple::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(std::string_view source, std::string msg) -> Diagnostic {
  return Diagnostic::Error(
      ErrorCode::kConfigError, fmt::format("{}: {}", source, msg));
}

// Reads an optional integer in [min, UINT32_MAX].
auto ReadCount(
    toml::node_view<const toml::node> node, std::string_view source,
    std::string_view key, uint32_t min, uint32_t& out) -> Result<void> {
  if (!node) {
    return {};
  }
  auto value = node.value<int64_t>();
  if (!value) {
    return std::unexpected(
        ConfigError(source, fmt::format("'{}' must be an integer", key)));
  }
  if (*value < min || *value > UINT32_MAX) {
    return std::unexpected(
        ConfigError(
            source, fmt::format(
                        "'{}' must be between {} and {}", key, min,
                        UINT32_MAX)));
  }
  out = static_cast<uint32_t>(*value);
  return {};
}

auto ReadMillis(
    toml::node_view<const toml::node> node, std::string_view source,
    std::string_view key, std::chrono::milliseconds& out) -> Result<void> {
  if (!node) {
    return {};
  }
  auto value = node.value<int64_t>();
  if (!value || *value < 0) {
    return std::unexpected(
        ConfigError(
            source,
            fmt::format("'{}' must be a non-negative number of ms", key)));
  }
  out = std::chrono::milliseconds(*value);
  return {};
}

auto ReadBool(
    toml::node_view<const toml::node> node, std::string_view source,
    std::string_view key, bool& out) -> Result<void> {
  if (!node) {
    return {};
  }
  auto value = node.value<bool>();
  if (!value) {
    return std::unexpected(
        ConfigError(source, fmt::format("'{}' must be a boolean", key)));
  }
  out = *value;
  return {};
}

auto FromTable(const toml::table& tbl, std::string_view source)
    -> Result<EngineConfig> {
  EngineConfig config;

  auto scheduler = tbl["scheduler"];
  if (auto r = ReadBool(
          scheduler["pull_mode"], source, "scheduler.pull_mode",
          config.pull_mode);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadCount(
          scheduler["max_iterations_per_run"], source,
          "scheduler.max_iterations_per_run", 1,
          config.max_iterations_per_run);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadCount(
          scheduler["max_cycle_iterations"], source,
          "scheduler.max_cycle_iterations", 1, config.max_cycle_iterations);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadMillis(
          scheduler["fast_cycle_threshold_ms"], source,
          "scheduler.fast_cycle_threshold_ms", config.fast_cycle_threshold);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadCount(
          scheduler["max_commit_retries"], source,
          "scheduler.max_commit_retries", 0, config.max_commit_retries);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadCount(
          scheduler["max_event_retries"], source,
          "scheduler.max_event_retries", 0, config.max_event_retries);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadCount(
          scheduler["max_subscriptions_per_action"], source,
          "scheduler.max_subscriptions_per_action", 1,
          config.max_subscriptions_per_action);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadCount(
          scheduler["max_total_subscriptions"], source,
          "scheduler.max_total_subscriptions", 1,
          config.max_total_subscriptions);
      !r) {
    return std::unexpected(r.error());
  }

  auto debounce = tbl["debounce"];
  if (auto r = ReadBool(
          debounce["auto"], source, "debounce.auto", config.auto_debounce);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadMillis(
          debounce["threshold_ms"], source, "debounce.threshold_ms",
          config.auto_debounce_threshold);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadCount(
          debounce["min_runs"], source, "debounce.min_runs", 1,
          config.auto_debounce_min_runs);
      !r) {
    return std::unexpected(r.error());
  }
  if (auto r = ReadMillis(
          debounce["max_ms"], source, "debounce.max_ms",
          config.max_auto_debounce);
      !r) {
    return std::unexpected(r.error());
  }

  if (auto path = tbl["storage"]["cache_path"]; path) {
    auto value = path.value<std::string>();
    if (!value) {
      return std::unexpected(
          ConfigError(source, "'storage.cache_path' must be a string"));
    }
    config.cache_path = fs::path(*value);
  }

  auto log = tbl["log"];
  if (auto level = log["level"]; level) {
    auto value = level.value<std::string>();
    static constexpr std::string_view kLevels[] = {
        "off", "error", "warn", "info", "debug", "trace"};
    bool known = false;
    if (value) {
      for (auto name : kLevels) {
        known = known || *value == name;
      }
    }
    if (!known) {
      return std::unexpected(
          ConfigError(
              source,
              "'log.level' must be one of off, error, warn, info, debug, "
              "trace"));
    }
    config.log_level = *value;
  }
  if (auto r = ReadBool(log["trace"], source, "log.trace", config.trace);
      !r) {
    return std::unexpected(r.error());
  }

  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "ripple.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(std::string_view text, std::string_view source)
    -> Result<EngineConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        ConfigError(source, fmt::format("parse error: {}", e.description())));
  }
  return FromTable(tbl, source);
}

auto LoadConfig(const fs::path& config_path) -> Result<EngineConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        ConfigError(
            config_path.string(),
            fmt::format("parse error: {}", e.description())));
  }
  auto config = FromTable(tbl, config_path.string());
  if (config && config->cache_path && config->cache_path->is_relative()) {
    config->cache_path = config_path.parent_path() / *config->cache_path;
  }
  return config;
}

}  // namespace ripple::config
