#pragma once

#include <cstddef>
#include <memory>

#include "ripple/common/diagnostic.hpp"
#include "ripple/common/diagnostic_sink.hpp"
#include "ripple/config/engine_config.hpp"
#include "ripple/runtime/clock.hpp"
#include "ripple/runtime/event_loop.hpp"
#include "ripple/runtime/scheduler.hpp"
#include "ripple/storage/cache.hpp"
#include "ripple/storage/remote_store.hpp"
#include "ripple/storage/tier_manager.hpp"
#include "ripple/trace/trace_manager.hpp"

namespace ripple::runtime {

// Owns one replica and its scheduler, wired from an EngineConfig: log level,
// trace, cache tier (a FileCache when cache_path is set, in-memory otherwise),
// event loop and clock.
class Engine {
 public:
  // `clock` defaults to a SteadyClock.
  static auto Create(
      storage::RemoteStore& remote, config::EngineConfig config,
      std::unique_ptr<Clock> clock = nullptr)
      -> Result<std::unique_ptr<Engine>>;

  ~Engine() = default;
  Engine(const Engine&) = delete;
  auto operator=(const Engine&) -> Engine& = delete;
  Engine(Engine&&) = delete;
  auto operator=(Engine&&) -> Engine& = delete;

  auto RunUntilIdle(size_t max_ticks = 100000) -> size_t {
    return loop_.RunUntilIdle(max_ticks);
  }

  [[nodiscard]] auto GetScheduler() -> Scheduler& {
    return *scheduler_;
  }
  [[nodiscard]] auto GetTiers() -> storage::TierManager& {
    return *tiers_;
  }
  [[nodiscard]] auto GetLoop() -> EventLoop& {
    return loop_;
  }
  [[nodiscard]] auto GetClock() -> Clock& {
    return *clock_;
  }
  [[nodiscard]] auto GetCache() -> storage::FactCache& {
    return *cache_;
  }
  [[nodiscard]] auto GetDiagnostics() -> DiagnosticSink& {
    return diagnostics_;
  }
  [[nodiscard]] auto GetTrace() -> trace::TraceManager& {
    return trace_;
  }
  [[nodiscard]] auto GetConfig() const -> const config::EngineConfig& {
    return config_;
  }

 private:
  Engine(
      storage::RemoteStore& remote, config::EngineConfig config,
      std::unique_ptr<Clock> clock, std::unique_ptr<storage::FactCache> cache);

  config::EngineConfig config_;
  std::unique_ptr<Clock> clock_;
  std::unique_ptr<storage::FactCache> cache_;
  EventLoop loop_;
  trace::TraceManager trace_;
  DiagnosticSink diagnostics_;
  std::unique_ptr<storage::TierManager> tiers_;
  std::unique_ptr<Scheduler> scheduler_;
};

}  // namespace ripple::runtime
