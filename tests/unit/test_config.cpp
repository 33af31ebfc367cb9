#include <gtest/gtest.h>
#include "toolhost/config.hpp"
#include "toolhost/error.hpp"
#include "toolhost/logging.hpp"
#include <cstdlib>

using namespace toolhost;

namespace {

void parse(ServerConfig& cfg, std::vector<const char*> args) {
    args.insert(args.begin(), "server");
    cfg.apply_args(static_cast<int>(args.size()), args.data());
}

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(ServerConfig, Defaults) {
    ServerConfig cfg;
    EXPECT_EQ(cfg.protocol_version, "2024-11-05");
    EXPECT_EQ(cfg.worker_threads, 4);
    EXPECT_EQ(cfg.http_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_FALSE(cfg.show_help);
}

TEST(ServerConfig, CommandLine) {
    ServerConfig cfg;
    parse(cfg, {"--log-level", "debug", "--workers", "8", "--http-timeout-ms", "1500"});
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.worker_threads, 8);
    EXPECT_EQ(cfg.http_timeout, std::chrono::milliseconds(1500));
}

TEST(ServerConfig, Help) {
    ServerConfig cfg;
    cfg.server_info = {"demo", "0.1"};
    parse(cfg, {"--help"});
    EXPECT_TRUE(cfg.show_help);
    auto text = cfg.usage("demo");
    EXPECT_NE(text.find("Usage: demo"), std::string::npos);
    EXPECT_NE(text.find("--workers"), std::string::npos);
}

TEST(ServerConfig, RejectsBadArguments) {
    ServerConfig cfg;
    EXPECT_THROW(parse(cfg, {"--bogus"}), ConfigError);
    EXPECT_THROW(parse(cfg, {"--workers"}), ConfigError);
    EXPECT_THROW(parse(cfg, {"--workers", "0"}), ConfigError);
    EXPECT_THROW(parse(cfg, {"--workers", "four"}), ConfigError);
    EXPECT_THROW(parse(cfg, {"--http-timeout-ms", "10x"}), ConfigError);
    EXPECT_THROW(parse(cfg, {"--log-level", "loud"}), ConfigError);
}

TEST(ServerConfig, RejectsOutOfRangeValues) {
    ServerConfig cfg;
    EXPECT_THROW(parse(cfg, {"--workers", "5000000000"}), ConfigError);
    EXPECT_THROW(parse(cfg, {"--workers", "100000"}), ConfigError);
    EXPECT_THROW(parse(cfg, {"--workers", "1025"}), ConfigError);
    EXPECT_THROW(parse(cfg, {"--http-timeout-ms", "99999999999"}), ConfigError);
    EXPECT_EQ(cfg.worker_threads, 4);

    parse(cfg, {"--workers", "1024"});
    EXPECT_EQ(cfg.worker_threads, 1024);
}

TEST(ServerConfig, EnvironmentThenFlags) {
    ScopedEnv workers("TOOLHOST_WORKERS", "2");
    ScopedEnv level("TOOLHOST_LOG_LEVEL", "warn");
    ScopedEnv timeout("TOOLHOST_HTTP_TIMEOUT_MS", "250");

    ServerConfig cfg;
    cfg.apply_env();
    EXPECT_EQ(cfg.worker_threads, 2);
    EXPECT_EQ(cfg.log_level, "warn");
    EXPECT_EQ(cfg.http_timeout, std::chrono::milliseconds(250));

    parse(cfg, {"--workers", "6"});
    EXPECT_EQ(cfg.worker_threads, 6);
    EXPECT_EQ(cfg.log_level, "warn");
}

TEST(ServerConfig, InvalidEnvironment) {
    ScopedEnv workers("TOOLHOST_WORKERS", "-3");
    ServerConfig cfg;
    EXPECT_THROW(cfg.apply_env(), ConfigError);
}

TEST(ServerConfig, EnvironmentWorkersOverLimit) {
    ScopedEnv workers("TOOLHOST_WORKERS", "5000000000");
    ServerConfig cfg;
    EXPECT_THROW(cfg.apply_env(), ConfigError);
}

TEST(Logging, ParseLevel) {
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("off"), spdlog::level::off);
    EXPECT_THROW(logging::parse_level("verbose"), ConfigError);
}

TEST(Logging, InitSetsLevel) {
    logging::init("critical");
    EXPECT_EQ(logging::get()->level(), spdlog::level::critical);
    EXPECT_EQ(logging::get()->name(), logging::LOGGER_NAME);
    logging::init("info");
}
