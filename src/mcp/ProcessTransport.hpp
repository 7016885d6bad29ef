// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief Configuration for spawning an MCP server process.
struct ProcessTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::string workingDir;                 ///< Empty means the current directory.
    std::map<std::string, std::string> env; ///< Added to (or overriding) the inherited environment.

    /// @brief A process that exits within this window after spawning is reported as ProcessDied.
    std::chrono::milliseconds startupGrace { 200 };

    /// @brief Time between SIGTERM and SIGKILL in close().
    std::chrono::milliseconds shutdownGrace { 5000 };

    /// @brief How long a response with an unknown id is kept before it is dropped.
    std::chrono::milliseconds unmatchedRetention { 30'000 };
};

/// @brief Identity sent in the MCP initialize request.
struct ClientInfo
{
    std::string name = "mcpmux";
    std::string version = "0.1.0";
};

/// @brief MCP protocol revision requested during initialization.
constexpr auto McpProtocolVersion = std::string_view { "2024-11-05" };

/// @brief Transport that talks Content-Length framed JSON-RPC to a child process over stdio.
///
/// A background thread reads the child's stdout and hands each decoded response to the
/// caller waiting for its id, so responses may arrive in any order. A second thread
/// drains stderr, keeping its tail for diagnostics. Requests may be issued from several
/// threads at once.
class ProcessTransport
{
  public:
    ProcessTransport();
    ~ProcessTransport();

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    /// @brief Spawns the server process with redirected stdin, stdout and stderr.
    /// @param config The process configuration.
    /// @return Success, a SpawnError if the executable cannot be launched, or ProcessDied
    ///         (with the captured stderr text) if it exits during the startup grace period.
    [[nodiscard]] auto start(const ProcessTransportConfig& config) -> VoidResult;

    /// @brief Performs the MCP initialize handshake. Subsequent calls return the cached result.
    /// @param clientInfo The client identity to announce.
    /// @param timeout Maximum time to wait for the server's answer.
    /// @return The server's initialize result, or an error.
    [[nodiscard]] auto initialize(const ClientInfo& clientInfo, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;

    /// @brief Sends a request and waits for its response.
    /// @param method The JSON-RPC method.
    /// @param params The parameters (null is sent as an empty object).
    /// @param timeout Maximum time to wait for the matching response.
    /// @return The result member, a RemoteError for a JSON-RPC error, or a TimeoutError.
    [[nodiscard]] auto request(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;

    /// @brief Sends a request without waiting for the response.
    /// @return The id allocated to the request, to be passed to awaitResponse().
    [[nodiscard]] auto send(std::string_view method, nlohmann::json params) -> Result<int64_t>;

    /// @brief Waits for the response to a request issued with send().
    ///
    /// On timeout the request is abandoned; a response arriving later is discarded.
    [[nodiscard]] auto awaitResponse(int64_t id, std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    /// @brief Sends a JSON-RPC notification.
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Terminates the process: closes stdin, sends SIGTERM, waits the shutdown grace
    ///        period and finally sends SIGKILL. Outstanding requests fail.
    void close();

    /// @brief Returns true while the process is running and its stdout is open.
    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Returns true once initialize() has succeeded.
    [[nodiscard]] auto isInitialized() const -> bool;

    /// @brief Returns the most recent stderr output of the process.
    [[nodiscard]] auto stderrText() const -> std::string;

    /// @brief Returns the number of requests waiting for a response.
    [[nodiscard]] auto pendingCount() const -> std::size_t;

    /// @brief Returns the number of retained responses that matched no request.
    [[nodiscard]] auto unmatchedCount() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpmux
