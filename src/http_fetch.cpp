#include "toolhost/http_fetch.hpp"
#include "toolhost/error.hpp"
#include "toolhost/logging.hpp"
#include "toolhost/version.hpp"

#include <httplib.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace toolhost {

namespace {

std::string strip_scheme(const std::string& url) {
    if (url.rfind("http://", 0) == 0) return url.substr(7);
    if (url.rfind("https://", 0) == 0) return url.substr(8);
    return url;
}

} // anonymous namespace

// ---------- HttpFetcher ----------

HttpFetcher::HttpFetcher(const std::string& base_url, Headers headers,
                         std::chrono::milliseconds timeout)
    : headers_(std::move(headers))
    , timeout_(timeout) {
    std::string hostport = strip_scheme(base_url);
    auto slash = hostport.find('/');
    if (slash != std::string::npos) hostport = hostport.substr(0, slash);
    if (hostport.empty()) {
        throw ConfigError("Invalid base URL: " + base_url);
    }
    host_ = hostport;
    base_url_ = (base_url.rfind("https://", 0) == 0 ? "https://" : "http://") + hostport;

    headers_.emplace("Accept", "application/json");
    headers_.emplace("User-Agent", "toolhost/" + std::string(LIBRARY_VERSION));
}

HttpFetcher::~HttpFetcher() = default;

json HttpFetcher::get_json(const std::string& path) {
    httplib::Client client(base_url_);
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);
    client.set_write_timeout(timeout_);
    client.set_follow_location(true);

    httplib::Headers headers(headers_.begin(), headers_.end());

    auto started = std::chrono::steady_clock::now();
    auto result = client.Get(path, headers);
    auto elapsed = std::chrono::steady_clock::now() - started;

    if (!result) {
        if (elapsed >= timeout_) {
            logging::get()->warn("GET {}{} timed out after {} ms", host_, path, timeout_.count());
            throw TimeoutError("Request timeout");
        }
        throw ToolError("Request failed: " + httplib::to_string(result.error()));
    }

    logging::get()->debug("GET {}{} -> {}", host_, path, result->status);

    if (result->status < 200 || result->status >= 300) {
        throw UpstreamError(result->status,
            "HTTP " + std::to_string(result->status) + " from " + host_ + path);
    }

    auto parsed = json::parse(result->body, nullptr, false);
    if (parsed.is_discarded()) {
        return json(result->body);
    }
    return parsed;
}

// ---------- url_encode ----------

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

} // namespace toolhost
