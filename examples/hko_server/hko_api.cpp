#include "hko_api.hpp"
#include <future>
#include <stdexcept>

namespace hko {

Language language_from_string(const std::string& code) {
    if (code == "en") return Language::English;
    if (code == "tc") return Language::Traditional;
    if (code == "sc") return Language::Simplified;
    throw std::invalid_argument("Unknown language: " + code);
}

std::string language_to_string(Language lang) {
    switch (lang) {
        case Language::English:     return "en";
        case Language::Traditional: return "tc";
        case Language::Simplified:  return "sc";
    }
    return "tc";
}

std::string weather_path(const std::string& data_type, Language lang) {
    return "/weatherAPI/opendata/weather.php?dataType=" + data_type
           + "&lang=" + language_to_string(lang);
}

std::string earthquake_path(Language lang) {
    return "/weatherAPI/opendata/earthquake.php?dataType=eqinfo&lang=" + language_to_string(lang);
}

std::string tsunami_path(Language lang) {
    return "/weatherAPI/opendata/tsunami.php?dataType=tsinfo&lang=" + language_to_string(lang);
}

json combine_all_weather(json forecast, json current, json warnings, json tips) {
    return json{
        {"localForecast", std::move(forecast)},
        {"currentWeather", std::move(current)},
        {"weatherWarnings", std::move(warnings)},
        {"specialTips", std::move(tips)}
    };
}

// ---------- Tools ----------

namespace {

std::function<std::string(Language)> weather(const std::string& data_type) {
    return [data_type](Language lang) { return weather_path(data_type, lang); };
}

} // anonymous namespace

std::vector<Feed> feeds() {
    return {
        {"hko_local_forecast", "Get Hong Kong local weather forecast (香港本地天氣預報)", weather("flw")},
        {"hko_9day_forecast", "Get Hong Kong 9-day weather forecast (香港9天天氣預報)", weather("fnd")},
        {"hko_current_weather", "Get current weather conditions in Hong Kong (香港實時天氣)", weather("rhrread")},
        {"hko_weather_warnings", "Get weather warnings in Hong Kong (香港天氣警告)", weather("warnsum")},
        {"hko_special_tips", "Get special weather tips for Hong Kong (香港特別天氣提示)", weather("swt")},
        {"hko_earthquake_info", "Get earthquake information (地震資訊)", earthquake_path},
        {"hko_tsunami_info", "Get tsunami information (海嘯資訊)", tsunami_path},
    };
}

toolhost::ToolDefinition language_tool(const std::string& name, const std::string& description) {
    toolhost::PropertySchema language;
    language.name = "language";
    language.description = "Language: en (English), tc (繁體中文), sc (簡體中文)";
    language.enum_values = {"en", "tc", "sc"};
    language.default_value = "tc";

    toolhost::ToolDefinition def;
    def.name = name;
    def.description = description;
    def.input_schema.properties = {language};
    return def;
}

void add_feed_tools(toolhost::ToolServer& server, std::shared_ptr<toolhost::HttpFetcher> http,
                    const std::vector<Feed>& selected) {
    for (const auto& feed : selected) {
        server.add_tool(language_tool(feed.name, feed.description),
            [http, path = feed.path](const json& args) {
                auto lang = language_from_string(args.at("language").get<std::string>());
                return toolhost::CallToolResult::pretty(http->get_json(path(lang)));
            });
    }
}

void add_tools(toolhost::ToolServer& server) {
    auto http = std::make_shared<toolhost::HttpFetcher>(
        BASE_URL, toolhost::HttpFetcher::Headers{}, server.config().http_timeout);

    add_feed_tools(server, http, feeds());

    // The four feeds are fetched side by side; any failure fails the call.
    server.add_tool_async(
        language_tool("hko_all_weather", "Get all weather information at once (獲取所有天氣資訊)"),
        [http](const json& args) {
            auto lang = language_from_string(args.at("language").get<std::string>());
            return std::async(std::launch::async, [http, lang] {
                auto fetch = [&http, lang](const char* data_type) {
                    return std::async(std::launch::async, [http, lang, data_type] {
                        return http->get_json(weather_path(data_type, lang));
                    });
                };
                auto forecast = fetch("flw");
                auto current = fetch("rhrread");
                auto warnings = fetch("warnsum");
                auto tips = fetch("swt");

                return toolhost::CallToolResult::pretty(combine_all_weather(
                    forecast.get(), current.get(), warnings.get(), tips.get()));
            });
        });
}

} // namespace hko
