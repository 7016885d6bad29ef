// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace mcpmux
{

namespace
{

    auto requirePositive(int value, std::string_view name) -> VoidResult
    {
        if (value <= 0)
            return makeError(ErrorCode::ConfigError, std::format("{} must be positive, got {}", name, value));
        return {};
    }

    auto parseLlmSection(const nlohmann::json& llm, LlmConfig& config) -> VoidResult
    {
        config.model = json::getStringOr(llm, "model", config.model);
        config.maxTokens = json::getIntOr(llm, "maxTokens", config.maxTokens);
        config.endpoint = json::getStringOr(llm, "endpoint", config.endpoint);
        config.apiKeyEnv = json::getStringOr(llm, "apiKeyEnv", config.apiKeyEnv);
        config.timeoutSeconds = json::getIntOr(llm, "timeoutSeconds", config.timeoutSeconds);
        config.systemPrompt = json::getStringOr(llm, "systemPrompt", config.systemPrompt);

        return requirePositive(config.maxTokens, "llm.maxTokens").and_then([&] {
            return requirePositive(config.timeoutSeconds, "llm.timeoutSeconds");
        });
    }

    auto parseConversationSection(const nlohmann::json& conversation, ConversationConfig& config) -> VoidResult
    {
        config.historyWindow = json::getIntOr(conversation, "historyWindow", config.historyWindow);
        config.maxResultLength = json::getIntOr(conversation, "maxResultLength", config.maxResultLength);
        config.maxToolSteps = json::getIntOr(conversation, "maxToolSteps", config.maxToolSteps);
        config.historyFile = json::getStringOr(conversation, "historyFile", config.historyFile);

        if (config.historyWindow < 0)
            return makeError(ErrorCode::ConfigError, "conversation.historyWindow must not be negative");
        return requirePositive(config.maxResultLength, "conversation.maxResultLength").and_then([&] {
            return requirePositive(config.maxToolSteps, "conversation.maxToolSteps");
        });
    }

    auto parseLogSection(const nlohmann::json& logJson, LogConfig& config) -> VoidResult
    {
        auto const levelName = json::getStringOr(logJson, "level", "info");
        auto const level = log::levelFromString(levelName);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", levelName));
        config.level = *level;
        config.file = json::getStringOr(logJson, "file", config.file);
        config.interactionCapacity = json::getIntOr(logJson, "interactionCapacity", config.interactionCapacity);
        return requirePositive(config.interactionCapacity, "log.interactionCapacity");
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcpmux";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcpmux";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(const nlohmann::json& root, const std::filesystem::path& baseDir) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Configuration root must be an object");

    auto config = AppConfig {};

    if (root.contains("llm"))
    {
        if (auto parsed = parseLlmSection(root["llm"], config.llm); !parsed)
            return std::unexpected(parsed.error());
    }

    if (root.contains("conversation"))
    {
        if (auto parsed = parseConversationSection(root["conversation"], config.conversation); !parsed)
            return std::unexpected(parsed.error());
    }

    if (root.contains("log"))
    {
        if (auto parsed = parseLogSection(root["log"], config.log); !parsed)
            return std::unexpected(parsed.error());
    }

    if (root.contains("backends"))
    {
        auto const& backends = root["backends"];
        if (!backends.is_array())
            return makeError(ErrorCode::ConfigError, "backends must be an array");

        for (const auto& entry: backends)
        {
            auto backend = parseBackendConfig(entry, baseDir);
            if (!backend)
            {
                log::warning("Skipping backend entry: {}", backend.error().message);
                config.invalidBackends.push_back(InvalidBackend {
                    .name = json::getStringOr(entry, "name", ""),
                    .error = backend.error(),
                });
                continue;
            }
            config.backends.push_back(std::move(*backend));
        }
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid config file {}: {}", path, parseResult.error().message));

    return parseConfig(*parseResult, std::filesystem::path(path).parent_path());
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace mcpmux
