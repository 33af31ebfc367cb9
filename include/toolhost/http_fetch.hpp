#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <string>

namespace toolhost {

using json = nlohmann::json;

/// Blocking GET client for the open-data APIs the tool servers wrap.
///
/// Thread-safe: each request opens its own connection, so concurrent calls
/// from worker threads do not wait on each other.
class HttpFetcher {
public:
    using Headers = std::map<std::string, std::string>;

    /// base_url is "http://host[:port]" or "https://host[:port]".
    HttpFetcher(const std::string& base_url,
                Headers headers = {},
                std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});
    ~HttpFetcher();

    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    /// GET path (with query) and parse the body as JSON. A body that is not
    /// JSON comes back as a JSON string.
    ///
    /// Throws TimeoutError, UpstreamError on a non-2xx status, and ToolError
    /// on any other failure.
    [[nodiscard]] json get_json(const std::string& path);

    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string base_url_;
    std::string host_;
    Headers headers_;
    std::chrono::milliseconds timeout_;
};

/// Percent-encode a path segment or query value.
std::string url_encode(const std::string& value);

} // namespace toolhost
