#include "toolhost/config.hpp"
#include "toolhost/error.hpp"
#include "toolhost/logging.hpp"
#include <cstdlib>
#include <sstream>
#include <string>

namespace toolhost {

namespace {

long parse_positive(const std::string& what, const std::string& value, long max) {
    std::size_t consumed = 0;
    long n = 0;
    try {
        n = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid " + what + ": '" + value + "'");
    }
    if (consumed != value.size() || n < 1) {
        throw ConfigError("Invalid " + what + ": '" + value + "'");
    }
    if (n > max) {
        throw ConfigError("Invalid " + what + ": '" + value + "' (maximum " + std::to_string(max) + ")");
    }
    return n;
}

void set_log_level(ServerConfig& cfg, const std::string& value) {
    (void)logging::parse_level(value);
    cfg.log_level = value;
}

} // anonymous namespace

void ServerConfig::apply_env() {
    if (const char* v = std::getenv("TOOLHOST_LOG_LEVEL")) {
        set_log_level(*this, v);
    }
    if (const char* v = std::getenv("TOOLHOST_WORKERS")) {
        worker_threads = static_cast<int>(parse_positive("TOOLHOST_WORKERS", v, MAX_WORKER_THREADS));
    }
    if (const char* v = std::getenv("TOOLHOST_HTTP_TIMEOUT_MS")) {
        http_timeout = std::chrono::milliseconds(parse_positive("TOOLHOST_HTTP_TIMEOUT_MS", v, MAX_HTTP_TIMEOUT_MS));
    }
}

void ServerConfig::apply_args(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            show_help = true;
            continue;
        }

        auto value_for = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "--log-level") {
            set_log_level(*this, value_for(arg));
        } else if (arg == "--workers") {
            worker_threads = static_cast<int>(parse_positive("--workers", value_for(arg), MAX_WORKER_THREADS));
        } else if (arg == "--http-timeout-ms") {
            http_timeout = std::chrono::milliseconds(parse_positive("--http-timeout-ms", value_for(arg), MAX_HTTP_TIMEOUT_MS));
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }
}

std::string ServerConfig::usage(const std::string& program) const {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << server_info.name << " " << server_info.version
        << " - MCP tool server over stdio (newline-delimited JSON-RPC 2.0)\n"
        << "\n"
        << "Options:\n"
        << "  --log-level <level>      trace|debug|info|warn|error|critical|off (default: info)\n"
        << "  --workers <n>            tool worker threads (default: 4)\n"
        << "  --http-timeout-ms <ms>   upstream request timeout (default: 30000)\n"
        << "  -h, --help               show this help\n"
        << "\n"
        << "Environment:\n"
        << "  TOOLHOST_LOG_LEVEL, TOOLHOST_WORKERS, TOOLHOST_HTTP_TIMEOUT_MS\n";
    return oss.str();
}

} // namespace toolhost
