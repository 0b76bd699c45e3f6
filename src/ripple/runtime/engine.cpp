#include "ripple/runtime/engine.hpp"

#include <memory>
#include <utility>

#include <fmt/format.h>

#include "ripple/common/log.hpp"

namespace ripple::runtime {

auto Engine::Create(
    storage::RemoteStore& remote, config::EngineConfig config,
    std::unique_ptr<Clock> clock) -> Result<std::unique_ptr<Engine>> {
  if (!SetLogLevel(config.log_level)) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kConfigError,
            fmt::format("unknown log level '{}'", config.log_level)));
  }

  std::unique_ptr<storage::FactCache> cache;
  if (config.cache_path) {
    auto opened = storage::FileCache::Open(*config.cache_path);
    if (!opened) {
      return std::unexpected(opened.error());
    }
    cache = std::move(*opened);
  } else {
    cache = std::make_unique<storage::MemoryCache>();
  }
  if (!clock) {
    clock = std::make_unique<SteadyClock>();
  }

  GetLogger()->info(
      "engine starting ({} mode, cache: {})",
      config.pull_mode ? "pull" : "push",
      config.cache_path ? config.cache_path->string() : "memory");
  return std::unique_ptr<Engine>(
      new Engine(remote, std::move(config), std::move(clock), std::move(cache)));
}

Engine::Engine(
    storage::RemoteStore& remote, config::EngineConfig config,
    std::unique_ptr<Clock> clock, std::unique_ptr<storage::FactCache> cache)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      cache_(std::move(cache)),
      loop_(*clock_) {
  trace_.SetEnabled(config_.trace);
  tiers_ = std::make_unique<storage::TierManager>(remote, cache_.get());
  scheduler_ = std::make_unique<Scheduler>(
      *tiers_, loop_, config_, diagnostics_, &trace_);
}

}  // namespace ripple::runtime
