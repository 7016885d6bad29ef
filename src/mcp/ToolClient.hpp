// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/BackendConfig.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/HttpTransport.hpp>
#include <mcp/InteractionLog.hpp>
#include <mcp/ProcessTransport.hpp>
#include <mcp/RestTransport.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcpmux
{

/// @brief Drops null and empty-string arguments and renames keys via @p mapping.
/// @param arguments The arguments as produced by the LLM. Non-objects yield an empty object.
/// @param mapping Argument name to backend argument name. Unmapped keys are kept.
[[nodiscard]] auto cleanArguments(const nlohmann::json& arguments, const std::map<std::string, std::string>& mapping)
    -> nlohmann::json;

/// @brief Uniform tool-calling surface over one backend connection.
///
/// Owns exactly one transport. initialize() must succeed before tools can be called;
/// callTool() may then be used from several threads at once.
class ToolClient
{
  public:
    using Backend = std::variant<std::unique_ptr<ProcessTransport>,
                                 std::unique_ptr<HttpTransport>,
                                 std::unique_ptr<RestTransport>>;

    /// @param config The backend settings.
    /// @param backend The transport matching config.kind.
    /// @param toolConfig Static tool metadata, possibly empty.
    /// @param observer Receives connection and call events. May be null.
    ToolClient(BackendConfig config, Backend backend, ToolConfig toolConfig, InteractionObserver* observer);
    ~ToolClient();

    ToolClient(const ToolClient&) = delete;
    ToolClient& operator=(const ToolClient&) = delete;

    /// @brief Connects to the backend and discovers its tools.
    /// @return The tool names in catalog order, or the connection error.
    [[nodiscard]] auto initialize() -> Result<std::vector<std::string>>;

    /// @brief Invokes a tool and returns its normalized text result.
    /// @return The text, UnknownTool for a tool this backend does not serve, or the backend's error.
    [[nodiscard]] auto callTool(std::string_view name, const nlohmann::json& arguments) -> Result<std::string>;

    /// @brief Releases the backend connection. Safe to call more than once.
    void close();

    [[nodiscard]] auto tools() const -> const std::vector<ToolDescriptor>& { return _tools; }
    [[nodiscard]] auto name() const -> const std::string& { return _config.name; }
    [[nodiscard]] auto kind() const -> BackendKind { return _config.kind; }
    [[nodiscard]] auto isInitialized() const -> bool { return _initialized; }
    [[nodiscard]] auto hasTool(std::string_view name) const -> bool;

  private:
    BackendConfig _config;
    Backend _backend;
    ToolConfig _toolConfig;
    InteractionObserver* _observer;
    std::vector<ToolDescriptor> _tools;
    std::atomic<bool> _initialized = false;

    [[nodiscard]] auto discoverTools() -> Result<std::vector<ToolDescriptor>>;
    [[nodiscard]] auto invoke(std::string_view name, const nlohmann::json& arguments) -> Result<std::string>;
};

/// @brief Creates the transport for @p config and wraps it in a ToolClient.
/// @param config The backend settings.
/// @param http HTTP client for http and rest backends. Must outlive the client.
/// @param observer Receives connection and call events. May be null.
/// @return The client (not yet initialized), or a ConfigError if the tool configuration cannot be loaded.
[[nodiscard]] auto makeToolClient(const BackendConfig& config, HttpClient& http, InteractionObserver* observer)
    -> Result<std::unique_ptr<ToolClient>>;

} // namespace mcpmux
