#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace logging {

namespace {

constexpr const char* kLoggerName = "linksharing";

} // namespace

std::shared_ptr<spdlog::logger> get() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    auto existing = spdlog::get(kLoggerName);
    if (existing) return existing;
    return spdlog::stderr_color_mt(kLoggerName);
  }();
  return logger;
}

bool init(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  // from_str falls back to "off" for unknown names
  if (lvl == spdlog::level::off && level != "off") return false;

  auto logger = get();
  logger->set_level(lvl);
  logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ [%t] %v");
  logger->flush_on(spdlog::level::warn);
  return true;
}

} // namespace logging
