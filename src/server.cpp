#include "toolhost/server.hpp"
#include "toolhost/error.hpp"
#include "toolhost/logging.hpp"
#include "toolhost/session.hpp"
#include "toolhost/transport/stdio_transport.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>

namespace toolhost {

// ----------- ToolServer::Impl -----------

struct ToolServer::Impl {
    ServerConfig config;
    ToolRegistry::Builder builder;
    std::optional<ToolRegistry> registry;

    explicit Impl(ServerConfig c) : config(std::move(c)) {}

    void check_open(const std::string& name) const {
        if (registry) {
            throw std::logic_error("Cannot add tool '" + name + "' after serving started");
        }
    }

    const ToolRegistry& frozen() {
        if (!registry) registry = builder.build();
        return *registry;
    }
};

// ----------- ToolServer -----------

ToolServer::ToolServer(ServerConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
}

ToolServer::~ToolServer() = default;

void ToolServer::add_tool(ToolDefinition def, ToolHandler handler) {
    impl_->check_open(def.name);
    impl_->builder.add(std::move(def), std::move(handler));
}

void ToolServer::add_tool_async(ToolDefinition def, AsyncToolHandler handler) {
    impl_->check_open(def.name);
    impl_->builder.add_async(std::move(def), std::move(handler));
}

const ServerConfig& ToolServer::config() const {
    return impl_->config;
}

const ToolRegistry& ToolServer::registry() {
    return impl_->frozen();
}

void ToolServer::serve(ChunkSource& in, FrameSink& out) {
    Session::Options opts;
    opts.server_info = impl_->config.server_info;
    opts.protocol_version = impl_->config.protocol_version;
    opts.worker_threads = impl_->config.worker_threads;

    Session session{std::move(opts), impl_->frozen()};
    session.run(in, out);
}

int ToolServer::serve_stdio() {
    // A closed stdout must surface as EPIPE, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        FdChunkSource in;
        FdFrameSink out;
        serve(in, out);
    } catch (const TransportError& e) {
        logging::get()->critical("Session aborted: {}", e.what());
        return 1;
    }
    return 0;
}

// ----------- run_stdio_server -----------

int run_stdio_server(int argc, const char* const* argv, ServerConfig defaults,
                     const std::function<void(ToolServer&)>& register_tools) {
    ServerConfig config = std::move(defaults);
    try {
        config.apply_env();
        config.apply_args(argc, argv);
        logging::init(config.log_level);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << config.usage(argc > 0 ? argv[0] : "server");
        return 1;
    }

    if (config.show_help) {
        std::cerr << config.usage(argc > 0 ? argv[0] : "server");
        return 0;
    }

    ToolServer server{std::move(config)};
    try {
        register_tools(server);
    } catch (const std::exception& e) {
        logging::get()->critical("Tool registration failed: {}", e.what());
        return 1;
    }
    return server.serve_stdio();
}

} // namespace toolhost
