// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <array>
#include <wsbridge/dispatcher.hpp>
#include <wsbridge/handlers.hpp>
#include <wsbridge/logging.hpp>

namespace wsbridge
{

namespace
{

using MethodHandler = json (*)(const Workspace&, const json&);

struct MethodEntry
{
    const char* name;
    MethodHandler handler;
};

constexpr std::array<MethodEntry, 2> kMethods = {{
    {kGetContextMethod, &handle_get_context},
    {kApplyChangesMethod, &handle_apply_changes},
}};

MethodHandler find_method(const std::string& name)
{
    for (const auto& entry : kMethods)
    {
        if (name == entry.name)
            return entry.handler;
    }
    return nullptr;
}

/// Dump that never throws: invalid UTF-8 is replaced with U+FFFD
std::string safe_dump(const json& j)
{
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string describe_id(const std::optional<JsonRpcId>& id)
{
    return safe_dump(id_to_json(id));
}

} // namespace

std::vector<std::string> Dispatcher::methods()
{
    std::vector<std::string> names;
    for (const auto& entry : kMethods)
        names.emplace_back(entry.name);
    return names;
}

std::string Dispatcher::serialize(const JsonRpcResponse& response)
{
    return safe_dump(response.to_json());
}

std::string Dispatcher::dispatch(const std::string& raw) const
{
    json message;
    try
    {
        message = json::parse(raw);
    }
    catch (const json::parse_error& e)
    {
        logger()->warn("Rejected unparsable request: {}", e.what());
        return serialize(
            JsonRpcResponse::failure(
                std::nullopt,
                JsonRpcErrorObject{
                    static_cast<int>(JsonRpcErrorCode::ParseError),
                    default_error_message(JsonRpcErrorCode::ParseError),
                    error_detail(e.what()),
                }
            )
        );
    }

    auto response = handle(message);
    if (!response)
        return {};
    return serialize(*response);
}

std::optional<JsonRpcResponse> Dispatcher::handle(const json& message) const
{
    JsonRpcRequest request;
    try
    {
        request = JsonRpcRequest::from_json(message);
    }
    catch (const JsonRpcError& e)
    {
        auto id = JsonRpcRequest::try_recover_id(message);
        logger()->warn(
            "Rejected invalid request (id {}): {}", describe_id(id), safe_dump(e.data())
        );
        return JsonRpcResponse::failure(id, JsonRpcErrorObject::from_error(e));
    }

    auto response = invoke(request);
    if (request.is_notification())
    {
        if (response.is_error())
            logger()->warn(
                "Notification {} failed: {}", request.method, safe_dump(response.error->to_json())
            );
        return std::nullopt;
    }
    return response;
}

JsonRpcResponse Dispatcher::invoke(const JsonRpcRequest& request) const
{
    auto log = logger();
    log->info("Received request: {} (id {})", request.method, describe_id(request.id));

    MethodHandler handler = find_method(request.method);
    if (!handler)
    {
        log->warn("Method not found: {}", request.method);
        return JsonRpcResponse::failure(
            request.id,
            JsonRpcErrorObject{
                static_cast<int>(JsonRpcErrorCode::MethodNotFound),
                default_error_message(JsonRpcErrorCode::MethodNotFound),
                json{{"method", request.method}},
            }
        );
    }

    try
    {
        return JsonRpcResponse::success(request.id, handler(workspace_, request.params));
    }
    catch (const JsonRpcError& e)
    {
        log->warn("{} failed with code {}: {}", request.method, static_cast<int>(e.code()), e.what());
        return JsonRpcResponse::failure(request.id, JsonRpcErrorObject::from_error(e));
    }
    catch (const std::exception& e)
    {
        log->error("{} failed: {}", request.method, e.what());
        return JsonRpcResponse::failure(
            request.id,
            JsonRpcErrorObject{
                static_cast<int>(JsonRpcErrorCode::InternalError),
                default_error_message(JsonRpcErrorCode::InternalError),
                error_detail(e.what()),
            }
        );
    }
}

} // namespace wsbridge
