#include <gtest/gtest.h>
#include "toolhost/error.hpp"
#include "toolhost/json_rpc.hpp"

using namespace toolhost;

TEST(RequestId, FromJson) {
    EXPECT_EQ(request_id_from_json(nlohmann::json(5)), RequestId{int64_t{5}});
    EXPECT_EQ(request_id_from_json(nlohmann::json("x")), RequestId{std::string("x")});
    EXPECT_EQ(request_id_from_json(nlohmann::json(nullptr)), RequestId{nullptr});
    EXPECT_EQ(request_id_from_json(nlohmann::json(1.5)), RequestId{1.5});
    EXPECT_FALSE(request_id_from_json(nlohmann::json::array()).has_value());
    EXPECT_FALSE(request_id_from_json(nlohmann::json(true)).has_value());
}

TEST(RequestId, LargeUnsignedKeepsValue) {
    auto j = nlohmann::json::parse("9223372036854775808");
    auto id = request_id_from_json(j);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<uint64_t>(*id), 9223372036854775808ull);

    nlohmann::json back = *id;
    EXPECT_EQ(back.dump(), "9223372036854775808");
}

TEST(RequestId, SmallUnsignedStoredSigned) {
    EXPECT_EQ(request_id_from_json(nlohmann::json::parse("3")), RequestId{int64_t{3}});
}

TEST(RequestId, ToJsonKeepsType) {
    nlohmann::json a = RequestId{int64_t{42}};
    nlohmann::json b = RequestId{std::string("42")};
    EXPECT_TRUE(a.is_number_integer());
    EXPECT_TRUE(b.is_string());
}

TEST(JsonRpcResponse, ResultShape) {
    nlohmann::json j = make_result(RequestId{int64_t{1}}, nlohmann::json::object());
    EXPECT_EQ(j, (nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", nlohmann::json::object()}}));
}

TEST(JsonRpcResponse, ErrorShape) {
    nlohmann::json j = make_error(RequestId{std::string("q")}, error::MethodNotFound, "Method not found: foo");
    EXPECT_EQ(j["id"], "q");
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found: foo");
    EXPECT_FALSE(j["error"].contains("data"));
}

TEST(JsonRpcResponse, FromJson) {
    auto j = nlohmann::json::parse(R"({"jsonrpc":"2.0","id":3,"error":{"code":-32601,"message":"bad"}})");
    auto resp = j.get<JsonRpcResponse>();
    EXPECT_EQ(resp.id, RequestId{int64_t{3}});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
    EXPECT_FALSE(resp.result.has_value());
}

TEST(JsonRpcRequest, NonStringFieldsTolerated) {
    auto req = nlohmann::json::parse(R"({"jsonrpc":2,"id":1,"method":5})").get<JsonRpcRequest>();
    ASSERT_TRUE(req.jsonrpc.has_value());
    EXPECT_NE(*req.jsonrpc, "2.0");
    EXPECT_TRUE(req.method.empty());
}
