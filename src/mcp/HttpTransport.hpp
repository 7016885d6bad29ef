// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/HttpClient.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief Transport that sends one JSON-RPC request per HTTP POST.
class HttpTransport
{
  public:
    /// @param url The JSON-RPC endpoint.
    /// @param http The HTTP client used for all requests. Must outlive the transport.
    /// @param timeout Deadline for each request.
    /// @param staticTools Tool names used when the server cannot list its tools.
    HttpTransport(std::string url,
                  HttpClient& http,
                  std::chrono::milliseconds timeout,
                  std::vector<std::string> staticTools = {});

    /// @brief Sends a JSON-RPC request and returns its result member.
    /// @return The result, a RemoteError for a non-2xx status or JSON-RPC error,
    ///         a ProtocolError for a body that is not JSON, or the HTTP client's error.
    [[nodiscard]] auto call(std::string_view method, nlohmann::json params = nullptr) -> Result<nlohmann::json>;

    /// @brief Discovers the server's tools via tools/list.
    ///
    /// If the server cannot be asked, the static tool list is used instead and a
    /// warning is logged. Fails only when the request failed and no static list exists.
    [[nodiscard]] auto initialize() -> Result<std::vector<ToolDescriptor>>;

    [[nodiscard]] auto url() const noexcept -> const std::string& { return _url; }

  private:
    std::string _url;
    HttpClient& _http;
    std::chrono::milliseconds _timeout;
    std::vector<std::string> _staticTools;
    std::atomic<int64_t> _nextId = 1;
};

} // namespace mcpmux
