#include "itick_api.hpp"
#include <toolhost/error.hpp>
#include <toolhost/types.hpp>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <memory>
#include <vector>

namespace itick {

std::string token_from_env() {
    const char* v = std::getenv(TOKEN_ENV);
    if (v == nullptr || *v == '\0') {
        throw toolhost::ConfigError(std::string(TOKEN_ENV) + " is not set");
    }
    return v;
}

toolhost::HttpFetcher::Headers request_headers(const std::string& token) {
    return {{"token", token}};
}

namespace {

std::string market_query(const std::string& region, const std::string& code) {
    return "region=" + toolhost::url_encode(region) + "&code=" + toolhost::url_encode(code);
}

} // anonymous namespace

std::string symbol_search_path(const std::string& type, const std::string& region,
                               const std::string& code) {
    return "/symbol/list?type=" + toolhost::url_encode(type) + "&" + market_query(region, code);
}

std::string quote_path(const std::string& region, const std::string& code) {
    return "/quote?" + market_query(region, code);
}

std::string kline_path(const std::string& region, const std::string& code,
                       const std::string& period, int64_t limit) {
    return "/kline?" + market_query(region, code) + "&period=" + toolhost::url_encode(period)
           + "&limit=" + std::to_string(limit);
}

std::string depth_path(const std::string& region, const std::string& code) {
    return "/depth?" + market_query(region, code);
}

std::string trades_path(const std::string& region, const std::string& code) {
    return "/trades?" + market_query(region, code);
}

int64_t kline_limit(const json& value) {
    if (value.is_number()) {
        double d = value.get<double>();
        if (std::isfinite(d) && std::floor(d) == d && d >= 1 && d <= MAX_KLINE_LIMIT) {
            return static_cast<int64_t>(d);
        }
    }
    throw toolhost::ToolError("limit must be a whole number between 1 and "
                              + std::to_string(MAX_KLINE_LIMIT));
}

json unwrap(const json& payload) {
    if (!payload.is_object()) {
        throw toolhost::ToolError("Unexpected iTick reply: " + payload.dump());
    }
    auto code = payload.find("code");
    if (code == payload.end() || *code != 0) {
        std::string msg = "Unknown error";
        auto m = payload.find("msg");
        if (m != payload.end() && m->is_string()) msg = m->get<std::string>();
        throw toolhost::ToolError("iTick error: " + msg);
    }
    auto data = payload.find("data");
    return data == payload.end() ? json(nullptr) : *data;
}

// ---------- Tools ----------

namespace {

toolhost::PropertySchema choice(const std::string& name, const std::string& description,
                                std::vector<json> values, const std::string& fallback) {
    toolhost::PropertySchema p;
    p.name = name;
    p.description = description;
    p.enum_values = std::move(values);
    p.default_value = fallback;
    return p;
}

toolhost::PropertySchema region(const std::string& description) {
    return choice("region", description, {"hk", "us", "cn", "sg", "jp"}, "hk");
}

toolhost::PropertySchema code(const std::string& description) {
    toolhost::PropertySchema p;
    p.name = "code";
    p.description = description;
    p.required = true;
    return p;
}

toolhost::ToolDefinition market_tool(const std::string& name, const std::string& description) {
    toolhost::ToolDefinition def;
    def.name = name;
    def.description = description;
    def.input_schema.properties = {region("Market region"), code("Stock code (股票代碼)")};
    return def;
}

std::string arg(const json& args, const char* name) {
    return args.at(name).get<std::string>();
}

using PathFor = std::function<std::string(const std::string&, const std::string&)>;

void add_market_tool(toolhost::ToolServer& server, std::shared_ptr<toolhost::HttpFetcher> http,
                     const std::string& name, const std::string& description, PathFor path) {
    server.add_tool(market_tool(name, description),
        [http, path = std::move(path)](const json& args) {
            auto data = unwrap(http->get_json(path(arg(args, "region"), arg(args, "code"))));
            return toolhost::CallToolResult::pretty(data);
        });
}

} // anonymous namespace

void add_tools(toolhost::ToolServer& server, std::shared_ptr<toolhost::HttpFetcher> http) {
    toolhost::ToolDefinition search;
    search.name = "itick_search_symbol";
    search.description = "Search for stock symbol information (搜索股票代碼)";
    search.input_schema.properties = {
        choice("type", "Asset type", {"stock", "crypto", "forex", "index"}, "stock"),
        region("Market region: hk (香港), us (美國), cn (中國), sg (新加坡), jp (日本)"),
        code("Stock code or symbol (股票代碼)")
    };
    server.add_tool(search, [http](const json& args) {
        auto path = symbol_search_path(arg(args, "type"), arg(args, "region"), arg(args, "code"));
        return toolhost::CallToolResult::pretty(unwrap(http->get_json(path)));
    });

    add_market_tool(server, http, "itick_get_price", "Get real-time stock price (獲取實時股票價格)", quote_path);

    toolhost::PropertySchema limit;
    limit.name = "limit";
    limit.type = toolhost::PropertyType::Number;
    limit.description = "Number of data points";
    limit.default_value = 30;

    toolhost::ToolDefinition kline;
    kline.name = "itick_get_kline";
    kline.description = "Get stock K-line/historical data (獲取股票K線/歷史數據)";
    kline.input_schema.properties = {
        region("Market region"),
        code("Stock code (股票代碼)"),
        choice("period", "Time period: 1m, 5m, 15m, 30m, 1h, 1d, 1w, 1M",
               {"1m", "5m", "15m", "30m", "1h", "1d", "1w", "1M"}, "1d"),
        limit
    };
    server.add_tool(kline, [http](const json& args) {
        auto path = kline_path(arg(args, "region"), arg(args, "code"), arg(args, "period"),
                               kline_limit(args.at("limit")));
        return toolhost::CallToolResult::pretty(unwrap(http->get_json(path)));
    });

    add_market_tool(server, http, "itick_get_quote", "Get detailed stock quote (獲取詳細股票報價)", quote_path);
    add_market_tool(server, http, "itick_get_depth", "Get order book depth (獲取盤口深度)", depth_path);
    add_market_tool(server, http, "itick_get_trades", "Get recent trades (獲取最近成交)", trades_path);
}

} // namespace itick
