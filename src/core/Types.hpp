// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief The role of a participant in a conversation turn.
enum class Role
{
    User,
    Assistant,
};

/// @brief Converts a Role enum to its string representation.
/// @param role The role to convert.
/// @return The string representation.
[[nodiscard]] constexpr auto roleToString(Role role) -> std::string_view
{
    switch (role)
    {
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

/// @brief Parses a string to a Role enum value.
/// @param str The string to parse.
/// @return The corresponding Role, or Role::User if unknown.
[[nodiscard]] constexpr auto roleFromString(std::string_view str) -> Role
{
    if (str == "assistant")
        return Role::Assistant;
    return Role::User;
}

/// @brief One completed exchange entry of the conversation.
struct ConversationTurn
{
    Role role = Role::User;
    std::string text;
};

/// @brief Represents a tool call request from the LLM (a `tool_use` content block).
struct ToolCall
{
    std::string id;
    std::string name;
    nlohmann::json arguments;
};

/// @brief Represents the result of executing a tool call.
struct ToolResult
{
    std::string callId;
    std::string content;
    bool isError = false;
};

/// @brief Describes a tool that the LLM can invoke, tagged with the backend that serves it.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
    std::string owningServer;
};

/// @brief The parsed reply of one LLM request: ordered text and tool calls.
struct LlmReply
{
    std::string text;
    std::vector<ToolCall> toolCalls;
    std::string stopReason;

    /// @brief Returns true if this reply contains tool calls.
    [[nodiscard]] auto hasToolCalls() const -> bool { return !toolCalls.empty(); }
};

} // namespace mcpmux
