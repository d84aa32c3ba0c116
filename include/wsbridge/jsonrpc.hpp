// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <wsbridge/types.hpp>

namespace wsbridge
{

// =============================================================================
// JSON-RPC 2.0 Exceptions
// =============================================================================

inline constexpr const char* kJsonRpcVersion = "2.0";

/// JSON-RPC error codes (reserved range only; no custom codes)
enum class JsonRpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

/// Canonical message for a reserved error code
inline const char* default_error_message(JsonRpcErrorCode code)
{
    switch (code)
    {
    case JsonRpcErrorCode::ParseError:
        return "Parse error";
    case JsonRpcErrorCode::InvalidRequest:
        return "Invalid Request";
    case JsonRpcErrorCode::MethodNotFound:
        return "Method not found";
    case JsonRpcErrorCode::InvalidParams:
        return "Invalid params";
    case JsonRpcErrorCode::InternalError:
        return "Internal error";
    }
    return "Internal error";
}

/// Exception for JSON-RPC errors
///
/// Handlers throw this to choose the error code of their response. Any other
/// exception escaping a handler is reported as InternalError.
class JsonRpcError : public std::runtime_error
{
  public:
    JsonRpcError(
        JsonRpcErrorCode code, const std::string& message, const json& data = nullptr
    )
        : std::runtime_error(message), code_(code), data_(data)
    {
    }

    JsonRpcErrorCode code() const
    {
        return code_;
    }
    const json& data() const
    {
        return data_;
    }

  private:
    JsonRpcErrorCode code_;
    json data_;
};

/// Build the conventional `{"detail": ...}` error data object
inline json error_detail(const std::string& detail)
{
    return json{{"detail", detail}};
}

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// JSON-RPC request ID (string, integer or other number)
using JsonRpcId = std::variant<std::string, int64_t, double>;

/// Convert an optional id to JSON (nullopt becomes null)
inline json id_to_json(const std::optional<JsonRpcId>& id)
{
    if (!id)
        return nullptr;
    return std::visit([](const auto& v) -> json { return v; }, *id);
}

/// Parse JsonRpcId from JSON
/// @return nullopt for null; throws for objects, arrays and booleans
inline std::optional<JsonRpcId> id_from_json(const json& j)
{
    if (j.is_null())
        return std::nullopt;
    if (j.is_string())
        return JsonRpcId{j.get<std::string>()};
    if (j.is_number_integer())
    {
        if (j.is_number_unsigned() &&
            j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw std::out_of_range("JSON-RPC id out of range");
        return JsonRpcId{j.get<int64_t>()};
    }
    if (j.is_number_float())
        return JsonRpcId{j.get<double>()};
    throw std::invalid_argument("Invalid JSON-RPC id type");
}

/// JSON-RPC 2.0 Request
struct JsonRpcRequest
{
    std::string method;
    json params;
    std::optional<JsonRpcId> id; // nullopt for notifications

    json to_json() const
    {
        json j = {{"jsonrpc", kJsonRpcVersion}, {"method", method}};
        if (!params.is_null())
            j["params"] = params;
        if (id)
            j["id"] = id_to_json(id);
        return j;
    }

    /// Parse and validate a request envelope
    /// @throws JsonRpcError (InvalidRequest) when the envelope is malformed
    static JsonRpcRequest from_json(const json& j)
    {
        if (!j.is_object())
            throw JsonRpcError(
                JsonRpcErrorCode::InvalidRequest,
                default_error_message(JsonRpcErrorCode::InvalidRequest),
                error_detail("Request must be a JSON object")
            );

        if (j.contains("jsonrpc"))
        {
            const auto& version = j.at("jsonrpc");
            if (!version.is_string() || version.get<std::string>() != kJsonRpcVersion)
                throw JsonRpcError(
                    JsonRpcErrorCode::InvalidRequest,
                    default_error_message(JsonRpcErrorCode::InvalidRequest),
                    error_detail("jsonrpc must be \"2.0\"")
                );
        }

        JsonRpcRequest req;
        if (j.contains("id"))
        {
            try
            {
                req.id = id_from_json(j.at("id"));
            }
            catch (const std::exception& e)
            {
                throw JsonRpcError(
                    JsonRpcErrorCode::InvalidRequest,
                    default_error_message(JsonRpcErrorCode::InvalidRequest),
                    error_detail(e.what())
                );
            }
        }

        if (!j.contains("method") || !j.at("method").is_string() ||
            j.at("method").get<std::string>().empty())
            throw JsonRpcError(
                JsonRpcErrorCode::InvalidRequest,
                default_error_message(JsonRpcErrorCode::InvalidRequest),
                error_detail("method must be a non-empty string")
            );
        req.method = j.at("method").get<std::string>();

        if (j.contains("params"))
        {
            const auto& params = j.at("params");
            if (!params.is_object() && !params.is_array() && !params.is_null())
                throw JsonRpcError(
                    JsonRpcErrorCode::InvalidRequest,
                    default_error_message(JsonRpcErrorCode::InvalidRequest),
                    error_detail("params must be an object or an array")
                );
            req.params = params;
        }
        return req;
    }

    /// Recover the id of a request that failed validation, if it is usable
    static std::optional<JsonRpcId> try_recover_id(const json& j)
    {
        if (!j.is_object() || !j.contains("id"))
            return std::nullopt;
        try
        {
            return id_from_json(j.at("id"));
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }

    bool is_notification() const
    {
        return !id.has_value();
    }
};

/// JSON-RPC 2.0 Error object
struct JsonRpcErrorObject
{
    int code;
    std::string message;
    json data;

    json to_json() const
    {
        json j = {{"code", code}, {"message", message}};
        if (!data.is_null())
            j["data"] = data;
        return j;
    }

    static JsonRpcErrorObject from_json(const json& j)
    {
        JsonRpcErrorObject err;
        err.code = j.at("code").get<int>();
        err.message = j.at("message").get<std::string>();
        if (j.contains("data"))
            err.data = j.at("data");
        return err;
    }

    static JsonRpcErrorObject from_error(const JsonRpcError& e)
    {
        return JsonRpcErrorObject{static_cast<int>(e.code()), e.what(), e.data()};
    }
};

/// JSON-RPC 2.0 Response
///
/// Exactly one of `result` and `error` is set. Use the factories to build one.
struct JsonRpcResponse
{
    std::optional<JsonRpcId> id;
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;

    static JsonRpcResponse success(std::optional<JsonRpcId> id, json result)
    {
        return JsonRpcResponse{std::move(id), std::move(result), std::nullopt};
    }

    static JsonRpcResponse failure(std::optional<JsonRpcId> id, JsonRpcErrorObject error)
    {
        return JsonRpcResponse{std::move(id), std::nullopt, std::move(error)};
    }

    json to_json() const
    {
        json j = {{"jsonrpc", kJsonRpcVersion}};
        if (error)
            j["error"] = error->to_json();
        else
            j["result"] = result.value_or(json::object());
        j["id"] = id_to_json(id);
        return j;
    }

    static JsonRpcResponse from_json(const json& j)
    {
        JsonRpcResponse resp;
        if (j.contains("id"))
            resp.id = id_from_json(j.at("id"));
        if (j.contains("result"))
            resp.result = j.at("result");
        if (j.contains("error"))
            resp.error = JsonRpcErrorObject::from_json(j.at("error"));
        return resp;
    }

    bool is_error() const
    {
        return error.has_value();
    }
};

} // namespace wsbridge
