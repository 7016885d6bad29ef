// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief How a backend is reached.
enum class BackendKind
{
    Process, ///< Child process speaking framed JSON-RPC over stdio.
    Http,    ///< JSON-RPC over HTTP POST.
    Rest,    ///< Plain REST endpoints, one per tool.
};

[[nodiscard]] constexpr auto backendKindToString(BackendKind kind) -> std::string_view
{
    switch (kind)
    {
        case BackendKind::Process: return "process";
        case BackendKind::Http: return "http";
        case BackendKind::Rest: return "rest";
    }
    return "unknown";
}

/// @brief Parses a backend kind as written in the configuration ("process", "stdio", "http", "rest", "api").
[[nodiscard]] auto backendKindFromString(std::string_view name) -> std::optional<BackendKind>;

/// @brief Static tool metadata for one backend.
struct ToolConfig
{
    /// @brief Per tool, argument name as produced by the LLM mapped to the name the backend expects.
    std::map<std::string, std::map<std::string, std::string>> parameterMap;

    /// @brief Tool schemas to present instead of (or in the absence of) the backend's own.
    std::vector<ToolDescriptor> tools;
};

/// @brief Connection settings of one backend.
struct BackendConfig
{
    std::string name;
    BackendKind kind = BackendKind::Process;

    // process
    std::string command;
    std::vector<std::string> args;
    std::string workingDir;
    std::map<std::string, std::string> env;

    // http
    std::string url;
    std::vector<std::string> staticTools;

    // rest
    std::string baseUrl;
    std::map<std::string, std::string> endpoints;

    std::string toolConfigPath;
    std::chrono::milliseconds timeout { 10'000 };
};

/// @brief Parses one entry of the "backends" array.
/// @param entry The JSON object.
/// @param baseDir Directory that relative toolConfig paths are resolved against. May be empty.
/// @return The backend configuration, or a ConfigError naming the missing or invalid field.
[[nodiscard]] auto parseBackendConfig(const nlohmann::json& entry, const std::filesystem::path& baseDir = {})
    -> Result<BackendConfig>;

/// @brief Parses a tool metadata document ({"parameterMap": ..., "tools": [...]}).
[[nodiscard]] auto parseToolConfig(const nlohmann::json& document) -> Result<ToolConfig>;

/// @brief Loads a tool metadata file.
[[nodiscard]] auto loadToolConfig(const std::filesystem::path& path) -> Result<ToolConfig>;

} // namespace mcpmux
