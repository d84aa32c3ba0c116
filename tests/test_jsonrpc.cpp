// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <wsbridge/jsonrpc.hpp>

using namespace wsbridge;

namespace
{

/// Parse a request and return the code of the JsonRpcError it throws (0 if none)
int request_error_code(const json& j)
{
    try
    {
        JsonRpcRequest::from_json(j);
    }
    catch (const JsonRpcError& e)
    {
        return static_cast<int>(e.code());
    }
    return 0;
}

} // namespace

// =============================================================================
// Request Envelope Tests
// =============================================================================

TEST(JsonRpcRequestTest, ParseFullRequest)
{
    auto req = JsonRpcRequest::from_json(
        json::parse(R"({"jsonrpc":"2.0","method":"getContext","params":{"file_paths":[]},"id":7})")
    );

    EXPECT_EQ(req.method, "getContext");
    EXPECT_TRUE(req.params.is_object());
    ASSERT_TRUE(req.id.has_value());
    EXPECT_EQ(std::get<int64_t>(*req.id), 7);
    EXPECT_FALSE(req.is_notification());
}

TEST(JsonRpcRequestTest, StringIdIsKept)
{
    auto req = JsonRpcRequest::from_json(
        json::parse(R"({"jsonrpc":"2.0","method":"getContext","id":"abc-1"})")
    );
    ASSERT_TRUE(req.id.has_value());
    EXPECT_EQ(std::get<std::string>(*req.id), "abc-1");
}

TEST(JsonRpcRequestTest, MissingVersionDefaultsTo20)
{
    auto req = JsonRpcRequest::from_json(json::parse(R"({"method":"getContext","id":1})"));
    EXPECT_EQ(req.method, "getContext");
}

TEST(JsonRpcRequestTest, NullAndAbsentIdAreNotifications)
{
    auto absent = JsonRpcRequest::from_json(json::parse(R"({"jsonrpc":"2.0","method":"m"})"));
    auto null_id =
        JsonRpcRequest::from_json(json::parse(R"({"jsonrpc":"2.0","method":"m","id":null})"));

    EXPECT_TRUE(absent.is_notification());
    EXPECT_TRUE(null_id.is_notification());
}

TEST(JsonRpcRequestTest, RejectsMalformedEnvelopes)
{
    const int invalid = static_cast<int>(JsonRpcErrorCode::InvalidRequest);

    EXPECT_EQ(request_error_code(json::array()), invalid);
    EXPECT_EQ(request_error_code(json("text")), invalid);
    EXPECT_EQ(request_error_code(json::parse(R"({"jsonrpc":"1.0","method":"m","id":1})")), invalid);
    EXPECT_EQ(request_error_code(json::parse(R"({"jsonrpc":2.0,"method":"m","id":1})")), invalid);
    EXPECT_EQ(request_error_code(json::parse(R"({"jsonrpc":"2.0","id":1})")), invalid);
    EXPECT_EQ(request_error_code(json::parse(R"({"jsonrpc":"2.0","method":5,"id":1})")), invalid);
    EXPECT_EQ(request_error_code(json::parse(R"({"jsonrpc":"2.0","method":"","id":1})")), invalid);
    EXPECT_EQ(request_error_code(json::parse(R"({"jsonrpc":"2.0","method":"m","id":true})")), invalid);
    EXPECT_EQ(request_error_code(json::parse(R"({"jsonrpc":"2.0","method":"m","id":[1]})")), invalid);
    EXPECT_EQ(
        request_error_code(json::parse(R"({"jsonrpc":"2.0","method":"m","params":"x","id":1})")),
        invalid
    );
}

TEST(JsonRpcRequestTest, ArrayParamsPassEnvelopeValidation)
{
    auto req =
        JsonRpcRequest::from_json(json::parse(R"({"jsonrpc":"2.0","method":"m","params":[1],"id":1})"));
    EXPECT_TRUE(req.params.is_array());
}

TEST(JsonRpcRequestTest, RecoverIdFromInvalidRequest)
{
    auto id = JsonRpcRequest::try_recover_id(json::parse(R"({"jsonrpc":"1.0","id":"x"})"));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(std::get<std::string>(*id), "x");

    EXPECT_FALSE(JsonRpcRequest::try_recover_id(json::parse(R"({"id":{"a":1}})")).has_value());
    EXPECT_FALSE(JsonRpcRequest::try_recover_id(json::array()).has_value());
}

TEST(JsonRpcRequestTest, ToJsonOmitsNullParamsAndId)
{
    JsonRpcRequest req;
    req.method = "getContext";
    auto j = req.to_json();

    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_FALSE(j.contains("params"));
    EXPECT_FALSE(j.contains("id"));
}

// =============================================================================
// Response Tests
// =============================================================================

TEST(JsonRpcResponseTest, SuccessCarriesResultAndId)
{
    auto resp = JsonRpcResponse::success(JsonRpcId{int64_t{3}}, json{{"files", json::object()}});
    auto j = resp.to_json();

    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 3);
    EXPECT_TRUE(j.contains("result"));
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponseTest, FailureWithoutIdSerializesNullId)
{
    auto resp = JsonRpcResponse::failure(
        std::nullopt, JsonRpcErrorObject{-32700, "Parse error", error_detail("bad")}
    );
    auto j = resp.to_json();

    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j["error"]["code"], -32700);
    EXPECT_EQ(j["error"]["data"]["detail"], "bad");
}

TEST(JsonRpcResponseTest, ErrorWithoutDataOmitsData)
{
    JsonRpcErrorObject err{-32601, "Method not found", nullptr};
    EXPECT_FALSE(err.to_json().contains("data"));
}

TEST(JsonRpcResponseTest, ParseErrorResponse)
{
    auto resp = JsonRpcResponse::from_json(json::parse(
        R"({"jsonrpc":"2.0","error":{"code":-32602,"message":"Invalid params"},"id":"q"})"
    ));

    EXPECT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error->code, -32602);
    EXPECT_EQ(resp.error->message, "Invalid params");
    EXPECT_EQ(std::get<std::string>(*resp.id), "q");
}

// =============================================================================
// Error Tests
// =============================================================================

TEST(JsonRpcErrorTest, ErrorObjectFromException)
{
    JsonRpcError e(JsonRpcErrorCode::InvalidParams, "Invalid params", error_detail("x missing"));
    auto obj = JsonRpcErrorObject::from_error(e);

    EXPECT_EQ(obj.code, -32602);
    EXPECT_EQ(obj.message, "Invalid params");
    EXPECT_EQ(obj.data["detail"], "x missing");
}

TEST(JsonRpcErrorTest, DefaultMessages)
{
    EXPECT_STREQ(default_error_message(JsonRpcErrorCode::ParseError), "Parse error");
    EXPECT_STREQ(default_error_message(JsonRpcErrorCode::InvalidRequest), "Invalid Request");
    EXPECT_STREQ(default_error_message(JsonRpcErrorCode::MethodNotFound), "Method not found");
    EXPECT_STREQ(default_error_message(JsonRpcErrorCode::InvalidParams), "Invalid params");
    EXPECT_STREQ(default_error_message(JsonRpcErrorCode::InternalError), "Internal error");
}

TEST(JsonRpcIdTest, LargeUnsignedIdIsRejected)
{
    json big = std::numeric_limits<uint64_t>::max();
    EXPECT_THROW(id_from_json(big), std::out_of_range);
}

TEST(JsonRpcIdTest, FractionalIdIsEchoedAsSent)
{
    auto req = JsonRpcRequest::from_json(json::parse(R"({"jsonrpc":"2.0","method":"m","id":1.5})"));
    ASSERT_TRUE(req.id.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(*req.id), 1.5);
    EXPECT_EQ(id_to_json(req.id).dump(), "1.5");

    auto whole = id_from_json(json::parse("1.0"));
    ASSERT_TRUE(whole.has_value());
    EXPECT_TRUE(std::holds_alternative<double>(*whole));
    EXPECT_TRUE(id_to_json(whole).is_number_float());
}
