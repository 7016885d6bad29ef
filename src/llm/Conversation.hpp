// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief Append-only record of the completed turns of a chat.
class Conversation
{
  public:
    /// @brief Records one completed exchange.
    void addExchange(std::string userText, std::string assistantText);

    /// @brief Returns all turns, oldest first.
    [[nodiscard]] auto turns() const -> std::span<const ConversationTurn>;

    /// @brief Returns the last @p count turns, oldest first.
    [[nodiscard]] auto window(std::size_t count) const -> std::span<const ConversationTurn>;

    /// @brief Builds the Messages API message array from the last @p count turns plus @p userText.
    [[nodiscard]] auto buildMessages(std::size_t count, std::string_view userText) const -> nlohmann::json;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto countOf(Role role) const -> std::size_t;

    void clear();

  private:
    std::vector<ConversationTurn> _turns;
};

/// @brief Formats a timestamp as ISO-8601 UTC date and time with seconds.
[[nodiscard]] auto isoTimestamp(std::chrono::system_clock::time_point time) -> std::string;

/// @brief Appends a session with the given turns to a history file.
///
/// The file holds {"sessions": [{"timestamp", "messages": [[role, text], ...]}]}.
/// A missing or unreadable file is replaced by a new document. Nothing is written
/// for an empty session.
/// @return Success, or an IoError if the file cannot be written.
[[nodiscard]] auto appendSessionToHistory(const std::filesystem::path& path,
                                          std::span<const ConversationTurn> turns,
                                          std::chrono::system_clock::time_point timestamp) -> VoidResult;

} // namespace mcpmux
