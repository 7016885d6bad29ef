// SPDX-License-Identifier: Apache-2.0
#include "LlmClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ResultNormalizer.hpp>

#include <format>

namespace mcpmux
{

LlmClient::LlmClient(LlmClientConfig config, HttpClient& http): _config(std::move(config)), _http(http)
{
}

auto LlmClient::buildRequestBody(std::string_view system,
                                 const nlohmann::json& messages,
                                 std::span<const ToolDescriptor> tools) const -> nlohmann::json
{
    auto body = nlohmann::json {
        { "model", _config.model },
        { "max_tokens", _config.maxTokens },
        { "system", system },
        { "messages", messages },
    };

    if (!tools.empty())
    {
        auto toolsJson = nlohmann::json::array();
        for (const auto& tool: tools)
        {
            toolsJson.push_back(nlohmann::json {
                { "name", tool.name },
                { "description", tool.description },
                { "input_schema", tool.inputSchema.is_object() ? tool.inputSchema : nlohmann::json::object() },
            });
        }
        body["tools"] = std::move(toolsJson);
        body["tool_choice"] = nlohmann::json { { "type", "auto" } };
    }

    return body;
}

auto LlmClient::send(std::string_view system, const nlohmann::json& messages, std::span<const ToolDescriptor> tools)
    -> Result<LlmReply>
{
    if (_config.apiKey.empty())
        return makeError(ErrorCode::ConfigError, "No API key configured for the LLM");

    auto request = HttpRequest {
        .method = HttpMethod::Post,
        .url = _config.endpoint,
        .headers = {
            { "x-api-key", _config.apiKey },
            { "anthropic-version", std::string(AnthropicApiVersion) },
            { "content-type", "application/json" },
        },
        .body = dumpJson(buildRequestBody(system, messages, tools)),
        .timeout = _config.timeout,
    };

    log::debug("LLM request: {} messages, {} tools", messages.size(), tools.size());
    auto response = _http.perform(request);
    if (!response)
        return std::unexpected(response.error());

    if (response->status != 200)
    {
        return makeError(ErrorCode::RemoteError,
                         std::format("API Error {}: {}", response->status,
                                     truncateText(normalizeBytes(response->body), 200, "")));
    }

    return json::parse(response->body).and_then(parseLlmReply);
}

auto parseLlmReply(const nlohmann::json& body) -> Result<LlmReply>
{
    if (!body.is_object() || !body.contains("content") || !body["content"].is_array())
        return makeError(ErrorCode::ProtocolError, std::format("Unexpected response format: {}", dumpJson(body)));

    auto reply = LlmReply {};
    reply.stopReason = json::getStringOr(body, "stop_reason", "");

    for (const auto& block: body["content"])
    {
        auto const type = json::getStringOr(block, "type", "");
        if (type == "text")
        {
            reply.text += json::getStringOr(block, "text", "");
        }
        else if (type == "tool_use")
        {
            reply.toolCalls.push_back(ToolCall {
                .id = json::getStringOr(block, "id", ""),
                .name = json::getStringOr(block, "name", ""),
                .arguments = block.value("input", nlohmann::json::object()),
            });
        }
        else
        {
            log::debug("Ignoring content block of type '{}'", type);
        }
    }

    return reply;
}

auto assistantContent(const LlmReply& reply) -> nlohmann::json
{
    auto content = nlohmann::json::array();
    if (!reply.text.empty())
        content.push_back(nlohmann::json { { "type", "text" }, { "text", reply.text } });
    for (const auto& call: reply.toolCalls)
    {
        content.push_back(nlohmann::json {
            { "type", "tool_use" },
            { "id", call.id },
            { "name", call.name },
            { "input", call.arguments.is_object() ? call.arguments : nlohmann::json::object() },
        });
    }
    return content;
}

auto toolResultContent(std::span<const ToolResult> results) -> nlohmann::json
{
    auto content = nlohmann::json::array();
    for (const auto& result: results)
    {
        auto block = nlohmann::json {
            { "type", "tool_result" },
            { "tool_use_id", result.callId },
            { "content", result.content },
        };
        if (result.isError)
            block["is_error"] = true;
        content.push_back(std::move(block));
    }
    return content;
}

} // namespace mcpmux
