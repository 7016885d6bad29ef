// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief Receives connection and tool call events from the registry and tool clients.
///
/// Implementations must be safe to call from several threads.
class InteractionObserver
{
  public:
    virtual ~InteractionObserver() = default;

    /// @brief Reports the outcome of connecting to a backend.
    /// @param server The backend name.
    /// @param kind The backend kind ("process", "http", "rest").
    /// @param success Whether the backend is usable.
    /// @param toolCount Number of tools discovered.
    /// @param error Failure description, empty on success.
    virtual void onServerConnection(std::string_view server,
                                    std::string_view kind,
                                    bool success,
                                    std::size_t toolCount,
                                    std::string_view error) = 0;

    /// @brief Reports the outcome of a tool call.
    /// @param server The backend name.
    /// @param tool The tool name.
    /// @param arguments The arguments as sent to the backend.
    /// @param result The normalized result text, empty on failure.
    /// @param success Whether the call succeeded.
    /// @param error Failure description, empty on success.
    virtual void onToolCall(std::string_view server,
                            std::string_view tool,
                            const nlohmann::json& arguments,
                            std::string_view result,
                            bool success,
                            std::string_view error) = 0;
};

/// @brief Kind of a recorded interaction.
enum class InteractionKind
{
    ServerConnection,
    ToolCall,
};

/// @brief One recorded interaction.
struct Interaction
{
    std::chrono::system_clock::time_point timestamp;
    InteractionKind kind = InteractionKind::ToolCall;
    std::string server;
    std::string detail; ///< Tool name, or backend kind for connections.
    nlohmann::json arguments;
    bool success = false;
    std::string result; ///< At most ResultExcerptLength bytes.
    std::string error;
    std::size_t toolCount = 0;
};

/// @brief Counters over the recorded interactions.
struct InteractionSummary
{
    std::size_t total = 0;
    std::size_t toolCalls = 0;
    std::size_t successfulCalls = 0;
    std::size_t failedCalls = 0;
    std::size_t connections = 0;
    std::size_t connected = 0;
    std::size_t failedConnections = 0;
};

/// @brief Bounded in-memory record of interactions, oldest entries evicted first.
class InteractionLog: public InteractionObserver
{
  public:
    /// @brief Maximum number of result bytes kept per tool call.
    static constexpr std::size_t ResultExcerptLength = 500;

    explicit InteractionLog(std::size_t capacity = 100);

    void onServerConnection(std::string_view server,
                            std::string_view kind,
                            bool success,
                            std::size_t toolCount,
                            std::string_view error) override;

    void onToolCall(std::string_view server,
                    std::string_view tool,
                    const nlohmann::json& arguments,
                    std::string_view result,
                    bool success,
                    std::string_view error) override;

    /// @brief Returns up to @p limit most recent entries, oldest first.
    [[nodiscard]] auto recent(std::size_t limit) const -> std::vector<Interaction>;

    [[nodiscard]] auto summary() const -> InteractionSummary;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t;

    void clear();

  private:
    mutable std::mutex _mutex;
    std::deque<Interaction> _entries;
    std::size_t _capacity;

    void append(Interaction entry);
};

/// @brief Renders an interaction as a short multi-line text block for display.
[[nodiscard]] auto formatInteraction(const Interaction& entry) -> std::string;

} // namespace mcpmux
