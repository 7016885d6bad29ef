// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/BackendConfig.hpp>
#include <mcp/InteractionLog.hpp>
#include <mcp/ToolClient.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief One line of the registry's server overview.
struct ServerSummary
{
    std::string name;
    BackendKind kind = BackendKind::Process;
    std::size_t toolCount = 0;
};

/// @brief Name-keyed collection of tool clients that aggregates their catalogs and routes calls.
///
/// Populated during startup and read-only afterwards, so dispatch() may run concurrently.
class ToolRegistry
{
  public:
    /// @param observer Receives dispatches that never reach a client. May be null.
    explicit ToolRegistry(InteractionObserver* observer = nullptr);
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// @brief Adds a client under @p name.
    /// @return DuplicateServer if the name is taken; the earlier registration stays active.
    [[nodiscard]] auto registerClient(std::string name, std::unique_ptr<ToolClient> client) -> VoidResult;

    /// @brief Returns true if a client is registered under @p name.
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// @brief Calls @p tool on the backend registered as @p server.
    /// @return The normalized text, UnknownServer (without any I/O) for an unregistered
    ///         server, or a ToolCallError wrapping the backend's failure.
    [[nodiscard]] auto dispatch(std::string_view server, std::string_view tool, const nlohmann::json& arguments)
        -> Result<std::string>;

    /// @brief Returns the tools of all servers in registration order, each name once.
    ///
    /// When two servers offer the same tool name, the first registered one wins.
    [[nodiscard]] auto aggregateCatalog() const -> std::vector<ToolDescriptor>;

    /// @brief Returns the server that serves @p tool in the aggregated catalog.
    [[nodiscard]] auto resolveServer(std::string_view tool) const -> std::optional<std::string>;

    [[nodiscard]] auto servers() const -> std::vector<ServerSummary>;
    [[nodiscard]] auto serverCount() const -> std::size_t;

    /// @brief Closes every client. Registrations are kept.
    void closeAll();

  private:
    struct Entry
    {
        std::string name;
        std::unique_ptr<ToolClient> client;
    };

    InteractionObserver* _observer;
    std::vector<Entry> _entries;
    std::map<std::string, std::size_t, std::less<>> _index;
};

} // namespace mcpmux
