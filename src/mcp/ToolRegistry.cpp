// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>

#include <format>
#include <set>

namespace mcpmux
{

ToolRegistry::ToolRegistry(InteractionObserver* observer): _observer(observer)
{
}

ToolRegistry::~ToolRegistry()
{
    closeAll();
}

auto ToolRegistry::registerClient(std::string name, std::unique_ptr<ToolClient> client) -> VoidResult
{
    if (_index.contains(name))
        return makeError(ErrorCode::DuplicateServer, std::format("Server '{}' is already registered", name));
    if (!client)
        return makeError(ErrorCode::InvalidArgument, std::format("No client given for server '{}'", name));

    _index.emplace(name, _entries.size());
    _entries.push_back(Entry { .name = std::move(name), .client = std::move(client) });
    return {};
}

auto ToolRegistry::contains(std::string_view name) const -> bool
{
    return _index.contains(name);
}

auto ToolRegistry::dispatch(std::string_view server, std::string_view tool, const nlohmann::json& arguments)
    -> Result<std::string>
{
    auto const it = _index.find(server);
    if (it == _index.end())
    {
        auto const message = std::format("Unknown server: {}", server);
        if (_observer)
            _observer->onToolCall(server, tool, arguments, "", false, message);
        return makeError(ErrorCode::UnknownServer, message);
    }

    auto result = _entries[it->second].client->callTool(tool, arguments);
    if (!result)
        return makeToolCallError(std::string(server), std::string(tool), result.error());
    return result;
}

auto ToolRegistry::aggregateCatalog() const -> std::vector<ToolDescriptor>
{
    auto catalog = std::vector<ToolDescriptor> {};
    auto seen = std::set<std::string, std::less<>> {};

    for (const auto& entry: _entries)
    {
        for (const auto& tool: entry.client->tools())
        {
            if (auto const [_, inserted] = seen.insert(tool.name); !inserted)
            {
                log::warning("Tool '{}' of server '{}' hidden by an earlier server", tool.name, entry.name);
                continue;
            }
            catalog.push_back(tool);
        }
    }
    return catalog;
}

auto ToolRegistry::resolveServer(std::string_view tool) const -> std::optional<std::string>
{
    for (const auto& entry: _entries)
    {
        if (entry.client->hasTool(tool))
            return entry.name;
    }
    return std::nullopt;
}

auto ToolRegistry::servers() const -> std::vector<ServerSummary>
{
    auto summaries = std::vector<ServerSummary> {};
    summaries.reserve(_entries.size());
    for (const auto& entry: _entries)
    {
        summaries.push_back(ServerSummary {
            .name = entry.name,
            .kind = entry.client->kind(),
            .toolCount = entry.client->tools().size(),
        });
    }
    return summaries;
}

auto ToolRegistry::serverCount() const -> std::size_t
{
    return _entries.size();
}

void ToolRegistry::closeAll()
{
    for (auto& entry: _entries)
        entry.client->close();
}

} // namespace mcpmux
