// SPDX-License-Identifier: Apache-2.0
#include "BackendConfig.hpp"

#include <core/JsonUtils.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace mcpmux
{

auto backendKindFromString(std::string_view name) -> std::optional<BackendKind>
{
    if (name == "process" || name == "stdio")
        return BackendKind::Process;
    if (name == "http")
        return BackendKind::Http;
    if (name == "rest" || name == "api")
        return BackendKind::Rest;
    return std::nullopt;
}

auto parseBackendConfig(const nlohmann::json& entry, const std::filesystem::path& baseDir) -> Result<BackendConfig>
{
    if (!entry.is_object())
        return makeError(ErrorCode::ConfigError, "Backend entry is not an object");

    auto config = BackendConfig {};
    config.name = json::getStringOr(entry, "name", "");
    if (config.name.empty())
        return makeError(ErrorCode::ConfigError, "Backend entry has no name");

    auto const typeName = json::getStringOr(entry, "type", "process");
    auto const kind = backendKindFromString(typeName);
    if (!kind)
        return makeError(ErrorCode::ConfigError,
                         std::format("Backend '{}': unknown type '{}'", config.name, typeName));
    config.kind = *kind;

    auto const timeoutSeconds = json::getIntOr(entry, "timeoutSeconds", 10);
    if (timeoutSeconds <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("Backend '{}': timeoutSeconds must be positive", config.name));
    config.timeout = std::chrono::seconds(timeoutSeconds);

    if (auto const toolConfig = json::getStringOr(entry, "toolConfig", ""); !toolConfig.empty())
    {
        auto path = std::filesystem::path(toolConfig);
        if (path.is_relative() && !baseDir.empty())
            path = baseDir / path;
        config.toolConfigPath = path.string();
    }

    switch (config.kind)
    {
        case BackendKind::Process:
            config.command = json::getStringOr(entry, "command", "");
            if (config.command.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Backend '{}': process backends need a command", config.name));
            config.args = json::getStringList(entry, "args");
            config.workingDir = json::getStringOr(entry, "workingDir", "");
            config.env = json::getStringMap(entry, "env");
            break;
        case BackendKind::Http:
            config.url = json::getStringOr(entry, "url", "");
            if (config.url.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Backend '{}': http backends need a url", config.name));
            config.staticTools = json::getStringList(entry, "tools");
            break;
        case BackendKind::Rest:
            config.baseUrl = json::getStringOr(entry, "baseUrl", "");
            config.endpoints = json::getStringMap(entry, "endpoints");
            if (config.baseUrl.empty() || config.endpoints.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Backend '{}': rest backends need a baseUrl and endpoints",
                                             config.name));
            break;
    }

    return config;
}

auto parseToolConfig(const nlohmann::json& document) -> Result<ToolConfig>
{
    if (!document.is_object())
        return makeError(ErrorCode::ConfigError, "Tool configuration is not an object");

    auto config = ToolConfig {};

    if (auto const it = document.find("parameterMap"); it != document.end())
    {
        if (!it->is_object())
            return makeError(ErrorCode::ConfigError, "parameterMap must be an object");
        for (const auto& [tool, mapping]: it->items())
            config.parameterMap[tool] = json::getStringMap(*it, tool);
    }

    if (auto const it = document.find("tools"); it != document.end())
    {
        if (!it->is_array())
            return makeError(ErrorCode::ConfigError, "tools must be an array");
        for (const auto& toolJson: *it)
        {
            auto name = json::getString(toolJson, "name");
            if (!name)
                return makeError(ErrorCode::ConfigError, "Tool entry without a name");

            // Anthropic tool definitions use input_schema, MCP uses inputSchema.
            auto schema = toolJson.value("input_schema", toolJson.value("inputSchema", nlohmann::json::object()));
            config.tools.push_back(ToolDescriptor {
                .name = std::move(*name),
                .description = json::getStringOr(toolJson, "description", ""),
                .inputSchema = std::move(schema),
                .owningServer = {},
            });
        }
    }

    return config;
}

auto loadToolConfig(const std::filesystem::path& path) -> Result<ToolConfig>
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open tool configuration: {}", path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto document = json::parse(ss.str());
    if (!document)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid tool configuration {}: {}", path.string(), document.error().message));

    return parseToolConfig(*document);
}

} // namespace mcpmux
