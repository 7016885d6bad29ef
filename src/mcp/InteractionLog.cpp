// SPDX-License-Identifier: Apache-2.0
#include "InteractionLog.hpp"

#include <mcp/ResultNormalizer.hpp>

#include <algorithm>
#include <format>

namespace mcpmux
{

InteractionLog::InteractionLog(std::size_t capacity): _capacity(std::max<std::size_t>(capacity, 1))
{
}

void InteractionLog::onServerConnection(
    std::string_view server, std::string_view kind, bool success, std::size_t toolCount, std::string_view error)
{
    append(Interaction {
        .timestamp = std::chrono::system_clock::now(),
        .kind = InteractionKind::ServerConnection,
        .server = std::string(server),
        .detail = std::string(kind),
        .arguments = {},
        .success = success,
        .result = {},
        .error = std::string(error),
        .toolCount = toolCount,
    });
}

void InteractionLog::onToolCall(std::string_view server,
                                std::string_view tool,
                                const nlohmann::json& arguments,
                                std::string_view result,
                                bool success,
                                std::string_view error)
{
    append(Interaction {
        .timestamp = std::chrono::system_clock::now(),
        .kind = InteractionKind::ToolCall,
        .server = std::string(server),
        .detail = std::string(tool),
        .arguments = arguments,
        .success = success,
        .result = truncateText(result, ResultExcerptLength, ""),
        .error = std::string(error),
        .toolCount = 0,
    });
}

auto InteractionLog::recent(std::size_t limit) const -> std::vector<Interaction>
{
    auto const lock = std::lock_guard(_mutex);
    auto const count = std::min(limit, _entries.size());
    return std::vector<Interaction>(_entries.end() - static_cast<std::ptrdiff_t>(count), _entries.end());
}

auto InteractionLog::summary() const -> InteractionSummary
{
    auto const lock = std::lock_guard(_mutex);
    auto result = InteractionSummary { .total = _entries.size() };
    for (const auto& entry: _entries)
    {
        if (entry.kind == InteractionKind::ToolCall)
        {
            ++result.toolCalls;
            ++(entry.success ? result.successfulCalls : result.failedCalls);
        }
        else
        {
            ++result.connections;
            ++(entry.success ? result.connected : result.failedConnections);
        }
    }
    return result;
}

auto InteractionLog::size() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _entries.size();
}

auto InteractionLog::capacity() const noexcept -> std::size_t
{
    return _capacity;
}

void InteractionLog::clear()
{
    auto const lock = std::lock_guard(_mutex);
    _entries.clear();
}

void InteractionLog::append(Interaction entry)
{
    auto const lock = std::lock_guard(_mutex);
    _entries.push_back(std::move(entry));
    while (_entries.size() > _capacity)
        _entries.pop_front();
}

auto formatInteraction(const Interaction& entry) -> std::string
{
    auto const time = std::chrono::floor<std::chrono::seconds>(entry.timestamp);
    auto const status = entry.success ? "OK  " : "FAIL";

    if (entry.kind == InteractionKind::ServerConnection)
    {
        auto text = std::format("{} [{:%T}] server {} ({})", status, time, entry.server, entry.detail);
        if (entry.success)
            text += std::format(": {} tools", entry.toolCount);
        else
            text += std::format(": {}", entry.error);
        return text;
    }

    auto text = std::format("{} [{:%T}] {}.{}\n   Params: {}", status, time, entry.server, entry.detail,
                            dumpJson(entry.arguments));
    if (entry.success)
        text += std::format("\n   Result: {}", truncateText(entry.result, 100));
    else
        text += std::format("\n   Error: {}", entry.error);
    return text;
}

} // namespace mcpmux
