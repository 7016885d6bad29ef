// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/InteractionLog.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace mcpmux::test
{

/// @brief InteractionObserver that keeps every event for inspection.
class RecordingObserver: public InteractionObserver
{
  public:
    struct Connection
    {
        std::string server;
        std::string kind;
        bool success = false;
        std::size_t toolCount = 0;
        std::string error;
    };

    struct Call
    {
        std::string server;
        std::string tool;
        nlohmann::json arguments;
        std::string result;
        bool success = false;
        std::string error;
    };

    void onServerConnection(std::string_view server,
                            std::string_view kind,
                            bool success,
                            std::size_t toolCount,
                            std::string_view error) override
    {
        auto const lock = std::lock_guard(_mutex);
        _connections.push_back(Connection {
            std::string(server), std::string(kind), success, toolCount, std::string(error) });
    }

    void onToolCall(std::string_view server,
                    std::string_view tool,
                    const nlohmann::json& arguments,
                    std::string_view result,
                    bool success,
                    std::string_view error) override
    {
        auto const lock = std::lock_guard(_mutex);
        _calls.push_back(Call {
            std::string(server), std::string(tool), arguments, std::string(result), success, std::string(error) });
    }

    [[nodiscard]] auto connections() const -> std::vector<Connection>
    {
        auto const lock = std::lock_guard(_mutex);
        return _connections;
    }

    [[nodiscard]] auto calls() const -> std::vector<Call>
    {
        auto const lock = std::lock_guard(_mutex);
        return _calls;
    }

  private:
    mutable std::mutex _mutex;
    std::vector<Connection> _connections;
    std::vector<Call> _calls;
};

} // namespace mcpmux::test
