// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/Conversation.hpp>
#include <llm/LlmClient.hpp>
#include <mcp/ToolRegistry.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief Configuration for the orchestrator.
struct OrchestratorConfig
{
    std::size_t historyWindow = 8;
    std::size_t maxResultLength = 400;
    int maxToolSteps = 5;
    std::string systemPrompt; ///< Empty selects defaultSystemPrompt().
};

/// @brief Reply text used when the LLM produced no text at all.
constexpr auto EmptyReplyText = std::string_view { "I couldn't process that request." };

/// @brief Builds the default system prompt listing the available services.
[[nodiscard]] auto defaultSystemPrompt(std::span<const std::string> services) -> std::string;

/// @brief Drives the LLM request/response cycle and dispatches tool calls.
///
/// Each user message starts a request with the recent conversation window and the
/// aggregated tool catalog. While the LLM asks for tools, their results are fed back
/// as tool_result blocks, up to maxToolSteps rounds. A final request without tools
/// follows if the LLM is still asking for tools after that.
class Orchestrator
{
  public:
    Orchestrator(LlmClient& llm, ToolRegistry& registry, Conversation& conversation, OrchestratorConfig config);

    /// @brief Processes one user message.
    /// @return The reply text, or the LLM error. The conversation is extended only on success.
    [[nodiscard]] auto processMessage(std::string_view userText) -> Result<std::string>;

    /// @brief Executes tool calls, concurrently when there are several.
    /// @return One result per call, in call order. Failures become error results.
    [[nodiscard]] auto executeToolCalls(std::span<const ToolCall> calls) -> std::vector<ToolResult>;

    /// @brief Returns the system prompt in effect.
    [[nodiscard]] auto systemPrompt() const -> std::string;

    [[nodiscard]] auto config() const -> const OrchestratorConfig& { return _config; }

  private:
    LlmClient& _llm;
    ToolRegistry& _registry;
    Conversation& _conversation;
    OrchestratorConfig _config;

    [[nodiscard]] auto executeToolCall(const ToolCall& call) -> ToolResult;
};

} // namespace mcpmux
