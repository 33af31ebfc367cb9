/// iTick market data server: symbol search, prices, quotes, K-lines,
/// order book depth and recent trades.
/// Usage: ITICK_TOKEN=<token> ./itick_server [--log-level debug]
/// Communicates over stdio (newline-delimited JSON-RPC).

#include "itick_api.hpp"
#include <toolhost/toolhost.hpp>
#include <memory>

int main(int argc, char** argv) {
    toolhost::ServerConfig defaults;
    defaults.server_info = {"itick-mcp-server", "1.0.0"};

    return toolhost::run_stdio_server(argc, argv, std::move(defaults), [](toolhost::ToolServer& server) {
        auto http = std::make_shared<toolhost::HttpFetcher>(
            itick::BASE_URL, itick::request_headers(itick::token_from_env()),
            server.config().http_timeout);
        itick::add_tools(server, http);
    });
}
