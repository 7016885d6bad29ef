// SPDX-License-Identifier: Apache-2.0
#include "Orchestrator.hpp"

#include <core/Log.hpp>
#include <mcp/ResultNormalizer.hpp>

#include <format>
#include <future>

namespace mcpmux
{

auto defaultSystemPrompt(std::span<const std::string> services) -> std::string
{
    auto list = std::string {};
    for (const auto& service: services)
    {
        if (!list.empty())
            list += ", ";
        list += std::format("'{}'", service);
    }

    return std::format("You are a helpful assistant with access to various tools and services.\n\n"
                       "Available services: [{}]\n\n"
                       "Be conversational and natural. Use the appropriate tools when users ask for specific "
                       "functionality. Keep responses concise.",
                       list);
}

Orchestrator::Orchestrator(LlmClient& llm,
                           ToolRegistry& registry,
                           Conversation& conversation,
                           OrchestratorConfig config):
    _llm(llm), _registry(registry), _conversation(conversation), _config(std::move(config))
{
}

auto Orchestrator::systemPrompt() const -> std::string
{
    if (!_config.systemPrompt.empty())
        return _config.systemPrompt;

    auto names = std::vector<std::string> {};
    for (const auto& server: _registry.servers())
        names.push_back(server.name);
    return defaultSystemPrompt(names);
}

auto Orchestrator::processMessage(std::string_view userText) -> Result<std::string>
{
    auto const system = systemPrompt();
    auto const catalog = _registry.aggregateCatalog();
    auto messages = _conversation.buildMessages(_config.historyWindow, userText);

    auto replyText = std::string {};
    auto appendText = [&replyText](const std::string& text) {
        if (text.empty())
            return;
        if (!replyText.empty())
            replyText += "\n\n";
        replyText += text;
    };

    auto finished = false;
    for (auto step = 0; step < _config.maxToolSteps && !finished; ++step)
    {
        log::debug("Orchestrator step {}/{}", step + 1, _config.maxToolSteps);

        auto reply = _llm.send(system, messages, catalog);
        if (!reply)
            return std::unexpected(reply.error());

        appendText(reply->text);
        if (!reply->hasToolCalls())
        {
            finished = true;
            break;
        }

        log::info("LLM requested {} tool call(s)", reply->toolCalls.size());
        auto const results = executeToolCalls(reply->toolCalls);
        messages.push_back(nlohmann::json { { "role", "assistant" }, { "content", assistantContent(*reply) } });
        messages.push_back(nlohmann::json { { "role", "user" }, { "content", toolResultContent(results) } });
    }

    if (!finished)
    {
        log::warning("Reached {} tool steps, asking for a final answer without tools", _config.maxToolSteps);
        auto reply = _llm.send(system, messages, {});
        if (!reply)
            return std::unexpected(reply.error());
        appendText(reply->text);
    }

    if (replyText.empty())
        replyText = EmptyReplyText;

    _conversation.addExchange(std::string(userText), replyText);
    return replyText;
}

auto Orchestrator::executeToolCalls(std::span<const ToolCall> calls) -> std::vector<ToolResult>
{
    auto results = std::vector<ToolResult> {};
    results.reserve(calls.size());

    if (calls.size() == 1)
    {
        results.push_back(executeToolCall(calls.front()));
        return results;
    }

    auto futures = std::vector<std::future<ToolResult>> {};
    futures.reserve(calls.size());
    for (const auto& call: calls)
        futures.push_back(std::async(std::launch::async, [this, &call] { return executeToolCall(call); }));
    for (auto& future: futures)
        results.push_back(future.get());
    return results;
}

auto Orchestrator::executeToolCall(const ToolCall& call) -> ToolResult
{
    auto const server = _registry.resolveServer(call.name);
    if (!server)
    {
        log::warning("Tool '{}' requested by the LLM is not in the catalog", call.name);
        return ToolResult {
            .callId = call.id,
            .content = std::format("Tool {} not found in any server", call.name),
            .isError = true,
        };
    }

    log::info("Executing tool: {}.{} (id: {})", *server, call.name, call.id);
    auto result = _registry.dispatch(*server, call.name, call.arguments);
    if (!result)
    {
        // ToolCallError messages already start with "server:tool: ".
        auto const& error = result.error();
        return ToolResult {
            .callId = call.id,
            .content = error.context ? std::format("Error calling {}", error.message)
                                     : std::format("Error calling {}:{}: {}", *server, call.name, error.message),
            .isError = true,
        };
    }

    return ToolResult {
        .callId = call.id,
        .content = truncateText(*result, _config.maxResultLength),
        .isError = false,
    };
}

} // namespace mcpmux
