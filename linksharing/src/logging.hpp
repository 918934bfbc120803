#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace logging {

// Configure level ("trace", "debug", "info", "warn", "error", "off") and pattern
// of the gateway logger. Returns false for an unknown level name.
bool init(const std::string& level);

// The "linksharing" logger; usable before init().
std::shared_ptr<spdlog::logger> get();

} // namespace logging
