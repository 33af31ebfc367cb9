#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace toolhost {
namespace logging {

/// stdout carries protocol frames, so the library logger always writes to stderr.
constexpr const char* LOGGER_NAME = "toolhost";

/// Map "trace", "debug", "info", "warn", "error", "critical" or "off".
/// Throws ConfigError on anything else.
spdlog::level::level_enum parse_level(const std::string& name);

/// Create (or reconfigure) the stderr logger at the given level.
void init(const std::string& level);

/// The library logger; created at info level on first use.
std::shared_ptr<spdlog::logger> get();

} // namespace logging
} // namespace toolhost
