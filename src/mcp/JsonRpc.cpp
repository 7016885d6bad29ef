// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace mcpmux::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
        { "params", params.is_null() ? nlohmann::json::object() : std::move(params) },
    };
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(int64_t id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(int64_t id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto messageId(const nlohmann::json& message) -> std::optional<int64_t>
{
    if (!message.is_object() || !message.contains("id"))
        return std::nullopt;

    auto const& id = message["id"];
    if (id.is_number_integer())
        return id.get<int64_t>();

    // Some servers echo numeric ids back as strings.
    if (id.is_string())
    {
        try
        {
            return std::stoll(id.get<std::string>());
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto response = Response {};
    response.id = messageId(message);

    if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (message.contains("error"))
    {
        auto const& err = message["error"];
        if (err.is_object())
        {
            response.error = RpcError {
                .code = err.value("code", 0),
                .message = err.value("message", "Unknown error"),
                .data = err.value("data", nlohmann::json {}),
            };
        }
        else
        {
            response.error = RpcError { .code = 0, .message = err.dump(), .data = {} };
        }
    }
    else if (!message.contains("method"))
    {
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");
    }

    return response;
}

auto resultOf(const Response& response) -> Result<nlohmann::json>
{
    if (response.error)
    {
        return makeError(ErrorCode::RemoteError,
                         std::format("RPC error {}: {}", response.error->code, response.error->message));
    }
    return response.result.value_or(nlohmann::json::object());
}

} // namespace mcpmux::jsonrpc
