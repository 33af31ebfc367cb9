/// Hong Kong Observatory server: forecasts, current weather, warnings,
/// earthquake and tsunami data from the Observatory's open data API.
/// Usage: ./hko_server [--log-level debug] [--http-timeout-ms N]
/// Communicates over stdio (newline-delimited JSON-RPC).

#include "hko_api.hpp"
#include <toolhost/toolhost.hpp>

int main(int argc, char** argv) {
    toolhost::ServerConfig defaults;
    defaults.server_info = {"hko-mcp-server", "1.0.0"};
    return toolhost::run_stdio_server(argc, argv, std::move(defaults), hko::add_tools);
}
