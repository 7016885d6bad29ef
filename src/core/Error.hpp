// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace mcpmux
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    TransportError,
    ProtocolError,
    SpawnError,
    ProcessDied,
    FramingError,
    TimeoutError,
    RemoteError,
    UnknownServer,
    UnknownTool,
    DuplicateServer,
    ToolCallError,
};

/// @brief Returns a stable, human readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::SpawnError: return "SpawnError";
        case ErrorCode::ProcessDied: return "ProcessDied";
        case ErrorCode::FramingError: return "FramingError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::RemoteError: return "RemoteError";
        case ErrorCode::UnknownServer: return "UnknownServer";
        case ErrorCode::UnknownTool: return "UnknownTool";
        case ErrorCode::DuplicateServer: return "DuplicateServer";
        case ErrorCode::ToolCallError: return "ToolCallError";
    }
    return "Unknown";
}

/// @brief Identifies the tool invocation a ToolCallError belongs to.
struct ToolCallContext
{
    std::string server;
    std::string tool;
    ErrorCode cause = ErrorCode::Unknown;
};

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::optional<ToolCallContext> context = std::nullopt;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

/// @brief Wraps a backend failure with the server and tool it occurred on.
/// @param server The backend name.
/// @param tool The tool name.
/// @param cause The original error.
/// @return An unexpected Error with code ErrorCode::ToolCallError.
[[nodiscard]] inline auto makeToolCallError(std::string server, std::string tool, const Error& cause)
    -> std::unexpected<Error>
{
    auto message = std::format("{}:{}: {}", server, tool, cause.message);
    return std::unexpected<Error>(Error {
        .code = ErrorCode::ToolCallError,
        .message = std::move(message),
        .context = ToolCallContext { .server = std::move(server), .tool = std::move(tool), .cause = cause.code },
    });
}

} // namespace mcpmux

template <>
struct std::formatter<mcpmux::Error>: std::formatter<std::string>
{
    auto format(const mcpmux::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcpmux::errorCodeName(error.code), error.message), ctx);
    }
};
