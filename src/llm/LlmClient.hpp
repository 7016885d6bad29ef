// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/HttpClient.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <span>
#include <string>
#include <string_view>

namespace mcpmux
{

/// @brief Connection settings for the Messages API.
struct LlmClientConfig
{
    std::string endpoint = "https://api.anthropic.com/v1/messages";
    std::string apiKey;
    std::string model = "claude-3-5-haiku-20241022";
    int maxTokens = 250;
    std::chrono::milliseconds timeout { 30'000 };
};

/// @brief Value sent in the anthropic-version header.
constexpr auto AnthropicApiVersion = std::string_view { "2023-06-01" };

/// @brief Client for the Anthropic Messages API: one POST per step.
class LlmClient
{
  public:
    /// @param config Connection settings.
    /// @param http The HTTP client used for requests. Must outlive the client.
    LlmClient(LlmClientConfig config, HttpClient& http);

    /// @brief Sends one request and parses the reply's content blocks.
    /// @param system The system prompt.
    /// @param messages The message array ({role, content} objects, oldest first).
    /// @param tools The tool catalog. When empty, no tools are offered.
    /// @return The reply, ConfigError without an API key, RemoteError for a non-200 status,
    ///         ProtocolError for a malformed body, or the HTTP client's error.
    [[nodiscard]] auto send(std::string_view system,
                            const nlohmann::json& messages,
                            std::span<const ToolDescriptor> tools) -> Result<LlmReply>;

    /// @brief Builds the request body.
    [[nodiscard]] auto buildRequestBody(std::string_view system,
                                        const nlohmann::json& messages,
                                        std::span<const ToolDescriptor> tools) const -> nlohmann::json;

    [[nodiscard]] auto config() const -> const LlmClientConfig& { return _config; }

  private:
    LlmClientConfig _config;
    HttpClient& _http;
};

/// @brief Parses the body of a Messages API response.
[[nodiscard]] auto parseLlmReply(const nlohmann::json& body) -> Result<LlmReply>;

/// @brief Builds the content array of an assistant message that repeats @p reply.
[[nodiscard]] auto assistantContent(const LlmReply& reply) -> nlohmann::json;

/// @brief Builds the content array of a user message carrying tool results.
[[nodiscard]] auto toolResultContent(std::span<const ToolResult> results) -> nlohmann::json;

} // namespace mcpmux
