/// Hong Kong government open data server: Observatory weather feeds, KMB bus
/// routes, stops and ETAs, Transport Department traffic speeds and Hospital
/// Authority A&E waits.
/// Usage: ./hk_transport_server [--log-level debug] [--workers N]
/// Communicates over stdio (newline-delimited JSON-RPC).

#include "hkgov_api.hpp"
#include <toolhost/toolhost.hpp>

int main(int argc, char** argv) {
    toolhost::ServerConfig defaults;
    defaults.server_info = {"hk-gov-mcp-server", "1.0.0"};
    return toolhost::run_stdio_server(argc, argv, std::move(defaults), hkgov::add_tools);
}
