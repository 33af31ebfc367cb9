#include <gtest/gtest.h>
#include "toolhost/http_fetch.hpp"
#include "toolhost/error.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace toolhost;

class HttpFetchTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Get("/weather", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(R"({"lang":")" + req.get_param_value("lang") + R"(","temp":21})",
                            "application/json");
        });
        server_.Get("/plain", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("Service notice: maintenance tonight", "text/plain");
        });
        server_.Get("/missing", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
            res.set_content("not found", "text/plain");
        });
        server_.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(600));
            res.set_content("{}", "application/json");
        });
        server_.Get("/headers", [](const httplib::Request& req, httplib::Response& res) {
            nlohmann::json j = {{"accept", req.get_header_value("Accept")},
                                {"agent", req.get_header_value("User-Agent")},
                                {"key", req.get_header_value("X-Api-Key")}};
            res.set_content(j.dump(), "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string base() const { return "http://127.0.0.1:" + std::to_string(port_); }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

TEST_F(HttpFetchTest, ParsesJsonBody) {
    HttpFetcher http(base());
    auto j = http.get_json("/weather?dataType=flw&lang=en");
    EXPECT_EQ(j["lang"], "en");
    EXPECT_EQ(j["temp"], 21);
    EXPECT_EQ(http.host(), "127.0.0.1:" + std::to_string(port_));
}

TEST_F(HttpFetchTest, NonJsonBodyBecomesString) {
    HttpFetcher http(base());
    auto j = http.get_json("/plain");
    ASSERT_TRUE(j.is_string());
    EXPECT_EQ(j.get<std::string>(), "Service notice: maintenance tonight");
}

TEST_F(HttpFetchTest, Non2xxIsUpstreamError) {
    HttpFetcher http(base());
    try {
        (void)http.get_json("/missing");
        FAIL() << "expected UpstreamError";
    } catch (const UpstreamError& e) {
        EXPECT_EQ(e.status, 404);
        EXPECT_EQ(std::string(e.what()), "HTTP 404 from 127.0.0.1:" + std::to_string(port_) + "/missing");
    }
}

TEST_F(HttpFetchTest, TimeoutIsTimeoutError) {
    HttpFetcher http(base(), {}, std::chrono::milliseconds(100));
    EXPECT_THROW((void)http.get_json("/slow"), TimeoutError);
}

TEST_F(HttpFetchTest, SendsDefaultAndCustomHeaders) {
    HttpFetcher http(base(), {{"X-Api-Key", "secret"}});
    auto j = http.get_json("/headers");
    EXPECT_EQ(j["accept"], "application/json");
    EXPECT_EQ(j["agent"].get<std::string>().rfind("toolhost/", 0), 0u);
    EXPECT_EQ(j["key"], "secret");
}

TEST_F(HttpFetchTest, ConcurrentRequests) {
    HttpFetcher http(base());
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&http, &ok] {
            if (http.get_json("/weather?lang=tc")["lang"] == "tc") ++ok;
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), 4);
}

TEST(HttpFetch, ConnectionRefusedIsToolError) {
    // Grab a free port, then release it so nothing is listening there.
    int port;
    {
        httplib::Server scratch;
        port = scratch.bind_to_any_port("127.0.0.1");
    }
    HttpFetcher http("http://127.0.0.1:" + std::to_string(port), {}, std::chrono::milliseconds(2000));
    try {
        (void)http.get_json("/");
        FAIL() << "expected ToolError";
    } catch (const TimeoutError&) {
        FAIL() << "refused connection reported as timeout";
    } catch (const ToolError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Request failed: ", 0), 0u);
    }
}

TEST(HttpFetch, InvalidBaseUrl) {
    EXPECT_THROW(HttpFetcher("http://"), ConfigError);
}

TEST(UrlEncode, ReservedCharacters) {
    EXPECT_EQ(url_encode("abc-_.~"), "abc-_.~");
    EXPECT_EQ(url_encode("a b/c?d"), "a%20b%2Fc%3Fd");
    EXPECT_EQ(url_encode("港"), "%E6%B8%AF");
}
