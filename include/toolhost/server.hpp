#pragma once
#include "config.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace toolhost {

/// A tool server: collects tools, then serves one session over stdio.
///
/// Tools must all be added before serving; the registry is frozen when the
/// first serve call starts.
class ToolServer {
public:
    explicit ToolServer(ServerConfig config);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    // ---- Tool registration ----
    void add_tool(ToolDefinition def, ToolHandler handler);
    void add_tool_async(ToolDefinition def, AsyncToolHandler handler);

    // ---- Serving ----

    /// Serve stdin/stdout until stdin closes. Returns the process exit
    /// status: 0 on end of stream, 1 on an I/O fault.
    [[nodiscard]] int serve_stdio();

    /// Serve the given streams. Throws TransportError on an I/O fault.
    void serve(ChunkSource& in, FrameSink& out);

    [[nodiscard]] const ServerConfig& config() const;

    /// The frozen registry; builds it if serving has not started yet.
    [[nodiscard]] const ToolRegistry& registry();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Entry point shared by the bundled servers: applies environment and
/// command line to defaults, configures logging, lets register_tools add
/// tools, then serves stdio. Returns the process exit status.
int run_stdio_server(int argc, const char* const* argv, ServerConfig defaults,
                     const std::function<void(ToolServer&)>& register_tools);

} // namespace toolhost
