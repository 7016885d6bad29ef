// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/BackendConfig.hpp>
#include <mcp/HttpClient.hpp>
#include <mcp/InteractionLog.hpp>
#include <mcp/ToolRegistry.hpp>
#include <mcpmux/Config.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief A backend that could not be brought up.
struct BackendFailure
{
    std::string name;
    Error error;
};

/// @brief Creates, initializes and registers a client for each backend.
///
/// A failing backend is reported and skipped; the others still load. Duplicate names
/// are rejected before their backend is started.
/// @return The backends that failed, in configuration order.
[[nodiscard]] auto connectBackends(std::span<const BackendConfig> backends,
                                   ToolRegistry& registry,
                                   HttpClient& http,
                                   InteractionObserver* observer) -> std::vector<BackendFailure>;

/// @brief Wires configuration, backends, the LLM and the interactive loop together.
class App
{
  public:
    /// @param config The application configuration.
    /// @param http HTTP client for LLM, http and rest backends. Null selects libcurl.
    explicit App(AppConfig config, std::unique_ptr<HttpClient> http = nullptr);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Installs the log sink and connects all backends.
    /// @return Success (possibly with failed backends), or an IoError if the log file cannot be opened.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Handles one line of user input: a command or a chat message.
    /// @return false when the user asked to quit.
    [[nodiscard]] auto handleInput(std::string_view line) -> bool;

    /// @brief Runs the interactive loop on stdin until /quit or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Closes all backends and saves the conversation. Called by the destructor.
    void shutdown();

    [[nodiscard]] auto registry() -> ToolRegistry&;
    [[nodiscard]] auto interactions() const -> const InteractionLog&;
    [[nodiscard]] auto failedBackends() const -> std::span<const BackendFailure>;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcpmux
