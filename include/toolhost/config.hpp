#pragma once
#include "types.hpp"
#include "version.hpp"
#include <chrono>
#include <string>

namespace toolhost {

/// Runtime settings shared by every tool server.
///
/// Precedence: built-in defaults < environment < command line.
struct ServerConfig {
    static constexpr long MAX_WORKER_THREADS = 1024;
    static constexpr long MAX_HTTP_TIMEOUT_MS = 3600000;

    Implementation server_info;
    std::string protocol_version = std::string(PROTOCOL_VERSION);
    int worker_threads = 4;
    std::chrono::milliseconds http_timeout{30000};
    std::string log_level = "info";
    bool show_help = false;

    /// Read TOOLHOST_LOG_LEVEL, TOOLHOST_WORKERS and TOOLHOST_HTTP_TIMEOUT_MS.
    /// Throws ConfigError on invalid or out-of-range values.
    void apply_env();

    /// Parse --log-level, --workers, --http-timeout-ms and --help.
    /// Throws ConfigError on unknown flags, missing or invalid values.
    void apply_args(int argc, const char* const* argv);

    /// Usage text for --help.
    [[nodiscard]] std::string usage(const std::string& program) const;
};

} // namespace toolhost
