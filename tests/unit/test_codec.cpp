#include <gtest/gtest.h>
#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"

using namespace mcpbridge;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "ping");
    EXPECT_EQ(req.jsonrpc, "2.0");
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<std::string>(req.id), "abc-123");
    EXPECT_EQ(req.method, "tools/list");
}

TEST(CodecParse, FractionalIdStaysDouble) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})");
    auto& req = std::get<JsonRpcRequest>(msg);
    ASSERT_TRUE(std::holds_alternative<double>(req.id));
    EXPECT_DOUBLE_EQ(std::get<double>(req.id), 1.5);
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    auto& notif = std::get<JsonRpcNotification>(msg);
    EXPECT_EQ(notif.method, "notifications/initialized");
}

TEST(CodecParse, NullIdIsNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    EXPECT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
}

TEST(CodecParse, RequestWithoutMethodKeepsId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":7})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 7);
    EXPECT_TRUE(req.method.empty());
}

TEST(CodecParse, MissingJsonrpcLeftToDispatcher) {
    auto msg = Codec::parse(R"({"id":1,"method":"ping"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_TRUE(std::get<JsonRpcRequest>(msg).jsonrpc.empty());
}

TEST(CodecParse, WrongJsonrpcVersionLeftToDispatcher) {
    auto msg = Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"ping"})");
    EXPECT_EQ(std::get<JsonRpcRequest>(msg).jsonrpc, "1.0");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json}"), McpParseError);
}

TEST(CodecParse, TruncatedJson) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1)"), McpParseError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), McpParseError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), McpParseError);
}

TEST(CodecParse, MethodMustBeString) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":42})"), McpParseError);
}

TEST(CodecParse, JsonrpcMustBeString) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":2,"id":1,"method":"ping"})"), McpParseError);
}

TEST(CodecParse, IdMustBeNumberOrString) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":{"a":1},"method":"ping"})"), McpParseError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":true,"method":"ping"})"), McpParseError);
}

TEST(CodecParse, NeitherIdNorMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","params":{}})"), McpParseError);
}

TEST(CodecParse, RequestWithParams) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello"}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->at("name"), "echo");
    EXPECT_EQ(req.params->at("arguments").at("text"), "hello");
}

TEST(CodecParse, UnicodeEscapes) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"caf\u00e9"}})");
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(req.params->at("name").get<std::string>(), "caf\xc3\xa9");
}

// ---- Serialize tests ----

TEST(CodecSerialize, SuccessResponse) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, nlohmann::json::object());
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_TRUE(j["result"].is_object());
    EXPECT_FALSE(j.contains("error"));
}

TEST(CodecSerialize, ErrorResponseWithNullId) {
    auto resp = JsonRpcResponse::failure(std::nullopt, error::ParseError, "parse error: x");
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], error::ParseError);
    EXPECT_EQ(j["error"]["message"], "parse error: x");
    EXPECT_FALSE(j.contains("result"));
}

TEST(CodecSerialize, StringIdKeepsType) {
    auto resp = JsonRpcResponse::success(RequestId{std::string("42")}, nlohmann::json::object());
    auto j = nlohmann::json::parse(Codec::serialize(resp));
    ASSERT_TRUE(j["id"].is_string());
    EXPECT_EQ(j["id"], "42");
}

TEST(CodecSerialize, SingleLine) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}},
                                         nlohmann::json{{"text", "line1\nline2"}});
    auto line = Codec::serialize(resp);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(CodecSerialize, InvalidUtf8Throws) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}},
                                         nlohmann::json{{"text", std::string("\xff\xfe")}});
    EXPECT_THROW((void)Codec::serialize(resp), McpSerializationError);
}
