#include "toolhost/logging.hpp"
#include "toolhost/error.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace toolhost {
namespace logging {

namespace {

std::mutex& init_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<spdlog::logger> get_or_create() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::info);
    }
    return logger;
}

} // anonymous namespace

spdlog::level::level_enum parse_level(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw ConfigError("Unknown log level: " + name);
}

void init(const std::string& level) {
    auto lvl = parse_level(level);
    std::lock_guard<std::mutex> lock(init_mutex());
    get_or_create()->set_level(lvl);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(init_mutex());
    return get_or_create();
}

} // namespace logging
} // namespace toolhost
