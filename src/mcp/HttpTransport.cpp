// SPDX-License-Identifier: Apache-2.0
#include "HttpTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/ResultNormalizer.hpp>

#include <format>

namespace mcpmux
{

namespace
{

    /// @brief Extracts the server's own error text from a failed HTTP response body.
    auto remoteMessage(const HttpResponse& response) -> std::string
    {
        auto const text = truncateText(normalizeBytes(response.body), 200);
        if (auto parsed = json::parse(response.body); parsed && parsed->is_object())
        {
            if (auto const it = parsed->find("error"); it != parsed->end())
            {
                if (it->is_object())
                    return json::getStringOr(*it, "message", text);
                if (it->is_string())
                    return it->get<std::string>();
            }
        }
        return text;
    }

} // namespace

HttpTransport::HttpTransport(std::string url,
                             HttpClient& http,
                             std::chrono::milliseconds timeout,
                             std::vector<std::string> staticTools):
    _url(std::move(url)), _http(http), _timeout(timeout), _staticTools(std::move(staticTools))
{
}

auto HttpTransport::call(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    auto const id = _nextId++;
    auto request = HttpRequest {
        .method = HttpMethod::Post,
        .url = _url,
        .headers = { { "Content-Type", "application/json" } },
        .body = dumpJson(jsonrpc::makeRequest(id, method, std::move(params))),
        .timeout = _timeout,
    };

    auto response = _http.perform(request);
    if (!response)
        return std::unexpected(response.error());

    if (!response->isSuccess())
    {
        return makeError(ErrorCode::RemoteError,
                         std::format("HTTP {} from {}: {}", response->status, _url, remoteMessage(*response)));
    }

    auto message = json::parse(response->body);
    if (!message)
        return makeError(ErrorCode::ProtocolError, std::format("Response from {} is not JSON", _url));

    return jsonrpc::parseResponse(*message).and_then(jsonrpc::resultOf);
}

auto HttpTransport::initialize() -> Result<std::vector<ToolDescriptor>>
{
    auto listed = call("tools/list");
    if (listed && listed->is_object() && listed->contains("tools") && (*listed)["tools"].is_array())
    {
        auto tools = std::vector<ToolDescriptor> {};
        for (const auto& toolJson: (*listed)["tools"])
        {
            auto name = json::getStringOr(toolJson, "name", "");
            if (name.empty())
                continue;
            tools.push_back(ToolDescriptor {
                .name = std::move(name),
                .description = json::getStringOr(toolJson, "description", ""),
                .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
                .owningServer = {},
            });
        }
        return tools;
    }

    if (!listed && _staticTools.empty())
        return std::unexpected(listed.error());

    auto const reason = listed ? std::string("no tool list in response") : listed.error().message;

    log::warning("tools/list failed on {} ({}), using {} configured tools", _url, reason, _staticTools.size());
    auto tools = std::vector<ToolDescriptor> {};
    for (const auto& name: _staticTools)
    {
        tools.push_back(ToolDescriptor {
            .name = name,
            .description = {},
            .inputSchema = nlohmann::json::object(),
            .owningServer = {},
        });
    }
    return tools;
}

} // namespace mcpmux
