#include "ripple/common/log.hpp"

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ripple {

auto GetLogger() -> const std::shared_ptr<spdlog::logger>& {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    auto existing = spdlog::get("ripple");
    if (existing) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt("ripple");
    created->set_pattern("[ripple][%H:%M:%S.%e][%l] %v");
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return logger;
}

auto SetLogLevel(std::string_view level) -> bool {
  auto parsed = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to "off"; only accept an explicit "off".
  if (parsed == spdlog::level::off && level != "off") {
    return false;
  }
  GetLogger()->set_level(parsed);
  return true;
}

}  // namespace ripple
