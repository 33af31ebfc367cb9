#pragma once
#include <toolhost/http_fetch.hpp>
#include <toolhost/server.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace itick {

using json = nlohmann::json;

constexpr const char* BASE_URL = "https://api.itick.org";

/// Environment variable holding the API token sent in the `token` header.
constexpr const char* TOKEN_ENV = "ITICK_TOKEN";

/// Token from ITICK_TOKEN. Throws toolhost::ConfigError when unset or empty.
std::string token_from_env();

/// Headers for every iTick request.
toolhost::HttpFetcher::Headers request_headers(const std::string& token);

// ---- API paths; every query value is percent-encoded ----
std::string symbol_search_path(const std::string& type, const std::string& region,
                               const std::string& code);
std::string quote_path(const std::string& region, const std::string& code);
std::string kline_path(const std::string& region, const std::string& code,
                       const std::string& period, int64_t limit);
std::string depth_path(const std::string& region, const std::string& code);
std::string trades_path(const std::string& region, const std::string& code);

constexpr int64_t MAX_KLINE_LIMIT = 10000;

/// The kline `limit` argument as a whole number in [1, MAX_KLINE_LIMIT].
/// Throws toolhost::ToolError otherwise.
int64_t kline_limit(const json& value);

/// The `data` member of an iTick reply. A reply whose `code` is not 0 is
/// a failure: throws toolhost::ToolError carrying its `msg`.
json unwrap(const json& payload);

/// Register the six itick_* tools against the given fetcher.
void add_tools(toolhost::ToolServer& server, std::shared_ptr<toolhost::HttpFetcher> http);

} // namespace itick
