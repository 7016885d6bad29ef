// SPDX-License-Identifier: Apache-2.0
#include "ToolClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ResultNormalizer.hpp>

#include <algorithm>
#include <format>

namespace mcpmux
{

namespace
{

    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };

    auto descriptorsFromToolList(const nlohmann::json& result) -> std::vector<ToolDescriptor>
    {
        auto tools = std::vector<ToolDescriptor> {};
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
            return tools;

        for (const auto& toolJson: result["tools"])
        {
            auto name = json::getStringOr(toolJson, "name", "");
            if (name.empty())
                continue;
            tools.push_back(ToolDescriptor {
                .name = std::move(name),
                .description = json::getStringOr(toolJson, "description", ""),
                .inputSchema = toolJson.value("inputSchema", nlohmann::json::object()),
                .owningServer = {},
            });
        }
        return tools;
    }

    /// @brief Interprets a tools/call result, turning isError results into RemoteError.
    auto toolCallText(const nlohmann::json& result) -> Result<std::string>
    {
        auto text = normalizeResult(result);
        if (result.is_object() && json::getBoolOr(result, "isError", false))
            return makeError(ErrorCode::RemoteError, text.empty() ? std::string("Tool reported an error") : text);
        return text;
    }

} // namespace

auto cleanArguments(const nlohmann::json& arguments, const std::map<std::string, std::string>& mapping)
    -> nlohmann::json
{
    auto cleaned = nlohmann::json::object();
    if (!arguments.is_object())
        return cleaned;

    for (const auto& [key, value]: arguments.items())
    {
        if (value.is_null() || (value.is_string() && value.get_ref<const std::string&>().empty()))
            continue;
        auto const it = mapping.find(key);
        cleaned[it != mapping.end() ? it->second : key] = value;
    }
    return cleaned;
}

ToolClient::ToolClient(BackendConfig config, Backend backend, ToolConfig toolConfig, InteractionObserver* observer):
    _config(std::move(config)), _backend(std::move(backend)), _toolConfig(std::move(toolConfig)), _observer(observer)
{
}

ToolClient::~ToolClient()
{
    close();
}

auto ToolClient::initialize() -> Result<std::vector<std::string>>
{
    auto const kindName = backendKindToString(_config.kind);
    if (_initialized)
    {
        auto names = std::vector<std::string> {};
        for (const auto& tool: _tools)
            names.push_back(tool.name);
        return names;
    }

    auto discovered = discoverTools();
    if (!discovered)
    {
        log::error("Backend '{}' ({}) failed: {}", _config.name, kindName, discovered.error().message);
        if (_observer)
            _observer->onServerConnection(_config.name, kindName, false, 0, discovered.error().message);
        close();
        return std::unexpected(discovered.error());
    }

    // Static schemas take precedence over what the backend reports.
    _tools = _toolConfig.tools.empty() ? std::move(*discovered) : _toolConfig.tools;

    auto names = std::vector<std::string> {};
    for (auto& tool: _tools)
    {
        tool.owningServer = _config.name;
        if (!tool.inputSchema.is_object())
            tool.inputSchema = nlohmann::json::object();
        if (!tool.inputSchema.contains("type"))
            tool.inputSchema["type"] = "object";
        names.push_back(tool.name);
    }

    _initialized = true;
    log::info("Backend '{}' ({}) connected with {} tools", _config.name, kindName, _tools.size());
    if (_observer)
        _observer->onServerConnection(_config.name, kindName, true, _tools.size(), "");
    return names;
}

auto ToolClient::discoverTools() -> Result<std::vector<ToolDescriptor>>
{
    return std::visit(
        Overloaded {
            [this](std::unique_ptr<ProcessTransport>& transport) -> Result<std::vector<ToolDescriptor>> {
                auto started = transport->start(ProcessTransportConfig {
                    .command = _config.command,
                    .args = _config.args,
                    .workingDir = _config.workingDir,
                    .env = _config.env,
                });
                if (!started)
                    return std::unexpected(started.error());

                auto handshake = transport->initialize(ClientInfo {}, _config.timeout);
                if (!handshake)
                    return std::unexpected(handshake.error());

                auto const serverInfo = handshake->value("serverInfo", nlohmann::json::object());
                log::info("MCP server '{}' is {} v{}", _config.name, json::getStringOr(serverInfo, "name", "unknown"),
                          json::getStringOr(serverInfo, "version", "unknown"));

                auto listed = transport->request("tools/list", nullptr, _config.timeout);
                if (!listed)
                {
                    if (_toolConfig.tools.empty())
                        return std::unexpected(listed.error());
                    log::warning("tools/list failed on '{}' ({}), using configured tools", _config.name,
                                 listed.error().message);
                    return std::vector<ToolDescriptor> {};
                }
                return descriptorsFromToolList(*listed);
            },
            [](std::unique_ptr<HttpTransport>& transport) -> Result<std::vector<ToolDescriptor>> {
                return transport->initialize();
            },
            [](std::unique_ptr<RestTransport>& transport) -> Result<std::vector<ToolDescriptor>> {
                auto tools = std::vector<ToolDescriptor> {};
                for (auto& name: transport->toolNames())
                {
                    tools.push_back(ToolDescriptor {
                        .name = std::move(name),
                        .description = {},
                        .inputSchema = nlohmann::json::object(),
                        .owningServer = {},
                    });
                }
                return tools;
            },
        },
        _backend);
}

auto ToolClient::hasTool(std::string_view name) const -> bool
{
    return std::ranges::any_of(_tools, [name](const ToolDescriptor& tool) { return tool.name == name; });
}

auto ToolClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<std::string>
{
    auto const mapping = _toolConfig.parameterMap.find(std::string(name));
    auto const cleaned = cleanArguments(
        arguments, mapping != _toolConfig.parameterMap.end() ? mapping->second : std::map<std::string, std::string> {});

    auto result = invoke(name, cleaned);
    if (result)
        log::debug("{}.{} returned {} bytes", _config.name, name, result->size());
    else
        log::warning("{}.{} failed: {}", _config.name, name, result.error().message);

    if (_observer)
    {
        _observer->onToolCall(_config.name, name, cleaned, result ? std::string_view(*result) : std::string_view {},
                              result.has_value(), result ? std::string_view {} : std::string_view(result.error().message));
    }
    return result;
}

auto ToolClient::invoke(std::string_view name, const nlohmann::json& arguments) -> Result<std::string>
{
    if (!_initialized)
        return makeError(ErrorCode::ProtocolError, std::format("Backend '{}' is not initialized", _config.name));
    if (!hasTool(name))
        return makeError(ErrorCode::UnknownTool, std::format("Tool {} not found on server {}", name, _config.name));

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments },
    };

    return std::visit(
        Overloaded {
            [&](std::unique_ptr<ProcessTransport>& transport) -> Result<std::string> {
                return transport->request("tools/call", std::move(params), _config.timeout).and_then(toolCallText);
            },
            [&](std::unique_ptr<HttpTransport>& transport) -> Result<std::string> {
                return transport->call("tools/call", std::move(params)).and_then(toolCallText);
            },
            [&](std::unique_ptr<RestTransport>& transport) -> Result<std::string> {
                return transport->callTool(name, arguments);
            },
        },
        _backend);
}

void ToolClient::close()
{
    if (auto* process = std::get_if<std::unique_ptr<ProcessTransport>>(&_backend); process && *process)
        (*process)->close();
    _initialized = false;
}

auto makeToolClient(const BackendConfig& config, HttpClient& http, InteractionObserver* observer)
    -> Result<std::unique_ptr<ToolClient>>
{
    auto toolConfig = ToolConfig {};
    if (!config.toolConfigPath.empty())
    {
        auto loaded = loadToolConfig(config.toolConfigPath);
        if (!loaded)
            return std::unexpected(loaded.error());
        toolConfig = std::move(*loaded);
    }

    auto backend = ToolClient::Backend {};
    switch (config.kind)
    {
        case BackendKind::Process:
            if (config.command.empty())
                return makeError(ErrorCode::ConfigError, std::format("Backend '{}' has no command", config.name));
            backend = std::make_unique<ProcessTransport>();
            break;
        case BackendKind::Http:
            if (config.url.empty())
                return makeError(ErrorCode::ConfigError, std::format("Backend '{}' has no url", config.name));
            backend = std::make_unique<HttpTransport>(config.url, http, config.timeout, config.staticTools);
            break;
        case BackendKind::Rest:
            if (config.baseUrl.empty())
                return makeError(ErrorCode::ConfigError, std::format("Backend '{}' has no baseUrl", config.name));
            backend = std::make_unique<RestTransport>(config.baseUrl, config.endpoints, http, config.timeout);
            break;
    }

    return std::make_unique<ToolClient>(config, std::move(backend), std::move(toolConfig), observer);
}

} // namespace mcpmux
