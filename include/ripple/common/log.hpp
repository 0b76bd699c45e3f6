#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ripple {

// Shared engine logger ("ripple"), writing to stderr so stdout stays free for
// the embedding program. Created on first use at warn level.
auto GetLogger() -> const std::shared_ptr<spdlog::logger>&;

// Accepts "off", "error", "warn", "info", "debug", "trace". Returns false for
// anything else and leaves the level unchanged.
auto SetLogLevel(std::string_view level) -> bool;

}  // namespace ripple
