// SPDX-License-Identifier: Apache-2.0
#include "Conversation.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <utility>

namespace mcpmux
{

void Conversation::addExchange(std::string userText, std::string assistantText)
{
    _turns.push_back(ConversationTurn { .role = Role::User, .text = std::move(userText) });
    _turns.push_back(ConversationTurn { .role = Role::Assistant, .text = std::move(assistantText) });
}

auto Conversation::turns() const -> std::span<const ConversationTurn>
{
    return _turns;
}

auto Conversation::window(std::size_t count) const -> std::span<const ConversationTurn>
{
    auto const all = std::span<const ConversationTurn>(_turns);
    return all.last(std::min(count, all.size()));
}

auto Conversation::buildMessages(std::size_t count, std::string_view userText) const -> nlohmann::json
{
    auto messages = nlohmann::json::array();
    for (const auto& turn: window(count))
        messages.push_back(nlohmann::json { { "role", roleToString(turn.role) }, { "content", turn.text } });
    messages.push_back(nlohmann::json { { "role", "user" }, { "content", userText } });
    return messages;
}

auto Conversation::size() const -> std::size_t
{
    return _turns.size();
}

auto Conversation::empty() const -> bool
{
    return _turns.empty();
}

auto Conversation::countOf(Role role) const -> std::size_t
{
    return static_cast<std::size_t>(
        std::ranges::count_if(_turns, [role](const ConversationTurn& turn) { return turn.role == role; }));
}

void Conversation::clear()
{
    _turns.clear();
}

auto isoTimestamp(std::chrono::system_clock::time_point time) -> std::string
{
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::seconds>(time));
}

auto appendSessionToHistory(const std::filesystem::path& path,
                            std::span<const ConversationTurn> turns,
                            std::chrono::system_clock::time_point timestamp) -> VoidResult
{
    if (turns.empty())
        return {};

    auto document = nlohmann::json { { "sessions", nlohmann::json::array() } };
    if (auto in = std::ifstream(path); in.is_open())
    {
        auto ss = std::stringstream {};
        ss << in.rdbuf();
        auto existing = json::parse(ss.str());
        if (existing && existing->is_object() && existing->contains("sessions") && (*existing)["sessions"].is_array())
            document = std::move(*existing);
        else
            log::warning("History file {} is not valid, starting a new one", path.string());
    }

    auto messages = nlohmann::json::array();
    for (const auto& turn: turns)
        messages.push_back(nlohmann::json::array({ roleToString(turn.role), turn.text }));

    document["sessions"].push_back(nlohmann::json {
        { "timestamp", isoTimestamp(timestamp) },
        { "messages", std::move(messages) },
    });

    auto out = std::ofstream(path, std::ios::trunc);
    if (!out.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write history file: {}", path.string()));

    out << document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!out)
        return makeError(ErrorCode::IoError, std::format("Failed to write history file: {}", path.string()));
    return {};
}

} // namespace mcpmux
