#pragma once
#include "hko_api.hpp"
#include <toolhost/server.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hkgov {

using json = nlohmann::json;

/// Byte ceilings for the large feeds.
constexpr size_t ROUTES_MAX_BYTES = 3000;
constexpr size_t TRAFFIC_MAX_BYTES = 2000;

/// Stops listed by kmb_get_stops.
constexpr size_t STOPS_SHOWN = 10;

/// "/v1/transport/kmb/eta/{stop_id}/{route}/{direction}/" with each
/// segment percent-encoded.
std::string kmb_eta_path(const std::string& stop_id, const std::string& route,
                         const std::string& direction);

/// {"total": N, "stops": [first `shown` entries of data]}; total is null
/// when the payload has no "data" array.
json stops_summary(const json& payload, size_t shown = STOPS_SHOWN);

/// Observatory feeds listed by this server: all single-feed tools except
/// tsunami information.
std::vector<hko::Feed> observatory_feeds();

/// Register every tool of hk-gov-mcp-server, in listing order. Upstream
/// timeouts come from server.config().
void add_tools(toolhost::ToolServer& server);

} // namespace hkgov
