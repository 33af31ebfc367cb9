#include "hkgov_api.hpp"
#include <toolhost/http_fetch.hpp>
#include <toolhost/types.hpp>
#include <algorithm>
#include <memory>

namespace hkgov {

std::string kmb_eta_path(const std::string& stop_id, const std::string& route,
                         const std::string& direction) {
    return "/v1/transport/kmb/eta/" + toolhost::url_encode(stop_id) + "/"
           + toolhost::url_encode(route) + "/" + toolhost::url_encode(direction) + "/";
}

json stops_summary(const json& payload, size_t shown) {
    json summary = {{"total", nullptr}, {"stops", json::array()}};
    if (!payload.is_object()) return summary;

    auto it = payload.find("data");
    if (it == payload.end() || !it->is_array()) return summary;

    summary["total"] = it->size();
    size_t n = std::min(it->size(), shown);
    for (size_t i = 0; i < n; ++i) {
        summary["stops"].push_back((*it)[i]);
    }
    return summary;
}

std::vector<hko::Feed> observatory_feeds() {
    auto all = hko::feeds();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [](const hko::Feed& f) { return f.name == "hko_tsunami_info"; }),
              all.end());
    return all;
}

// ---------- Tools ----------

namespace {

constexpr const char* KMB_BASE_URL = "https://data.etabus.gov.hk";
constexpr const char* TD_BASE_URL = "https://api.data.gov.hk";
constexpr const char* HA_BASE_URL = "http://www.ha.org.hk";

toolhost::ToolDefinition no_args_tool(const std::string& name, const std::string& description) {
    toolhost::ToolDefinition def;
    def.name = name;
    def.description = description;
    return def;
}

toolhost::PropertySchema required_string(const std::string& name, const std::string& description) {
    toolhost::PropertySchema p;
    p.name = name;
    p.description = description;
    p.required = true;
    return p;
}

} // anonymous namespace

void add_tools(toolhost::ToolServer& server) {
    using toolhost::CallToolResult;
    using toolhost::HttpFetcher;

    auto timeout = server.config().http_timeout;
    auto hko_http = std::make_shared<HttpFetcher>(hko::BASE_URL, HttpFetcher::Headers{}, timeout);
    auto kmb = std::make_shared<HttpFetcher>(KMB_BASE_URL, HttpFetcher::Headers{}, timeout);
    auto td = std::make_shared<HttpFetcher>(TD_BASE_URL, HttpFetcher::Headers{}, timeout);
    auto ha = std::make_shared<HttpFetcher>(HA_BASE_URL, HttpFetcher::Headers{}, timeout);

    // ---- Hong Kong Observatory ----
    hko::add_feed_tools(server, hko_http, observatory_feeds());

    // ---- Transport Department ----
    server.add_tool(no_args_tool("td_traffic_speed", "Get Hong Kong traffic speed map data (香港交通速度圖)"),
        [td](const nlohmann::json&) {
            return CallToolResult::pretty(td->get_json("/v1/transport/traffic-speed-map"),
                                          TRAFFIC_MAX_BYTES);
        });

    // ---- Hospital Authority ----
    server.add_tool(no_args_tool("ha_ae_waiting_time",
                                 "Get A&E waiting time for Hong Kong hospitals (公立醫院急症室輪候時間)"),
        [ha](const nlohmann::json&) {
            return CallToolResult::pretty(ha->get_json("/opendata/aed/aedwtdata-en.json"));
        });

    // ---- KMB ----
    server.add_tool(no_args_tool("kmb_get_routes", "Get all KMB bus routes (九巴路線列表)"),
        [kmb](const nlohmann::json&) {
            return CallToolResult::pretty(kmb->get_json("/v1/transport/kmb/route/"),
                                          ROUTES_MAX_BYTES);
        });

    server.add_tool(no_args_tool("kmb_get_stops", "Get all KMB bus stops (九巴巴士站列表)"),
        [kmb](const nlohmann::json&) {
            return CallToolResult::pretty(
                stops_summary(kmb->get_json("/v1/transport/kmb/stop/")));
        });

    toolhost::ToolDefinition eta;
    eta.name = "kmb_get_eta";
    eta.description = "Get KMB bus ETA for a specific stop and route (查詢九巴到站時間)";
    auto direction = required_string("direction", "Direction: inbound or outbound");
    direction.enum_values = {"inbound", "outbound"};
    eta.input_schema.properties = {
        required_string("stop_id", "Stop ID (巴士站編號)"),
        required_string("route", "Route number (路線號碼)"),
        direction
    };

    server.add_tool(eta, [kmb](const nlohmann::json& args) {
        auto path = hkgov::kmb_eta_path(args.at("stop_id").get<std::string>(),
                                        args.at("route").get<std::string>(),
                                        args.at("direction").get<std::string>());
        return CallToolResult::pretty(kmb->get_json(path));
    });
}

} // namespace hkgov
