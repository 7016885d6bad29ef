// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <mcp/BackendConfig.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief LLM configuration section.
struct LlmConfig
{
    std::string model = "claude-3-5-haiku-20241022";
    int maxTokens = 250;
    std::string endpoint = "https://api.anthropic.com/v1/messages";
    std::string apiKeyEnv = "ANTHROPIC_API_KEY";
    int timeoutSeconds = 30;
    std::string systemPrompt; ///< Empty selects the built-in prompt listing the services.
};

/// @brief Conversation configuration section.
struct ConversationConfig
{
    int historyWindow = 8;
    int maxResultLength = 400;
    int maxToolSteps = 5;
    std::string historyFile = "conversation_history.json";
};

/// @brief Logging configuration section.
struct LogConfig
{
    log::Level level = log::Level::Info;
    std::string file = "mcp_interactions.log"; ///< Empty disables the log file.
    int interactionCapacity = 100;
};

/// @brief A backend entry that could not be parsed.
struct InvalidBackend
{
    std::string name; ///< Empty if the entry had no usable name.
    Error error;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LlmConfig llm;
    ConversationConfig conversation;
    LogConfig log;
    std::vector<BackendConfig> backends;        ///< In file order, duplicates included.
    std::vector<InvalidBackend> invalidBackends; ///< Entries skipped while loading.
};

/// @brief Builds the configuration from a parsed document.
/// @param root The JSON document.
/// @param baseDir Directory that relative tool configuration paths are resolved against.
/// @return The configuration, or a ConfigError for an invalid global section.
///         Invalid backend entries are collected in AppConfig::invalidBackends instead.
[[nodiscard]] auto parseConfig(const nlohmann::json& root, const std::filesystem::path& baseDir = {})
    -> Result<AppConfig>;

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults with no backends.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Returns the default config directory ($XDG_CONFIG_HOME/mcpmux or ~/.config/mcpmux).
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcpmux
