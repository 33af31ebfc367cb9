#pragma once
#include <toolhost/http_fetch.hpp>
#include <toolhost/server.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hko {

using json = nlohmann::json;

/// Hong Kong Observatory open data.
constexpr const char* BASE_URL = "https://data.weather.gov.hk";

/// Response language, as accepted by the Observatory API's lang parameter.
enum class Language {
    English,      // en
    Traditional,  // tc
    Simplified    // sc
};

/// "en", "tc" or "sc". Throws std::invalid_argument otherwise.
Language language_from_string(const std::string& code);
std::string language_to_string(Language lang);

/// API path for a weather.php data set, e.g. weather_path("flw", lang).
std::string weather_path(const std::string& data_type, Language lang);
std::string earthquake_path(Language lang);
std::string tsunami_path(Language lang);

/// The four feeds of hko_all_weather under one object.
json combine_all_weather(json forecast, json current, json warnings, json tips);

/// One Observatory data set served as a single tool.
struct Feed {
    std::string name;
    std::string description;
    std::function<std::string(Language)> path;
};

/// Every single-feed tool, in listing order.
std::vector<Feed> feeds();

/// Tool definition taking one optional `language` argument (default "tc").
toolhost::ToolDefinition language_tool(const std::string& name, const std::string& description);

/// Register one tool per feed; each returns the feed pretty-printed.
void add_feed_tools(toolhost::ToolServer& server, std::shared_ptr<toolhost::HttpFetcher> http,
                    const std::vector<Feed>& selected);

/// Register every tool of hko-mcp-server: the feeds plus hko_all_weather.
void add_tools(toolhost::ToolServer& server);

} // namespace hko
