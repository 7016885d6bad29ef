// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/HttpClient.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux
{

/// @brief Percent-encodes a string for use in a URL query component (RFC 3986 unreserved set kept).
[[nodiscard]] auto urlEncode(std::string_view text) -> std::string;

/// @brief Builds a query string from tool arguments.
///
/// Strings are used verbatim, null values are skipped and every other value is
/// serialized as compact JSON. Keys keep the object's order.
[[nodiscard]] auto buildQueryString(const nlohmann::json& arguments) -> std::string;

/// @brief Transport for plain REST services: one GET endpoint per tool, no JSON-RPC envelope.
class RestTransport
{
  public:
    /// @param baseUrl Prefix of every endpoint URL.
    /// @param endpoints Tool name to path mapping.
    /// @param http The HTTP client used for all requests. Must outlive the transport.
    /// @param timeout Deadline for each request.
    RestTransport(std::string baseUrl,
                  std::map<std::string, std::string> endpoints,
                  HttpClient& http,
                  std::chrono::milliseconds timeout);

    /// @brief Returns the tool names, which are the keys of the endpoint map.
    [[nodiscard]] auto toolNames() const -> std::vector<std::string>;

    /// @brief Calls the endpoint mapped to @p tool with @p arguments as query parameters.
    /// @return The response body decoded as UTF-8, UnknownTool if no endpoint is mapped,
    ///         or RemoteError for a non-2xx status.
    [[nodiscard]] auto callTool(std::string_view tool, const nlohmann::json& arguments) -> Result<std::string>;

  private:
    std::string _baseUrl;
    std::map<std::string, std::string> _endpoints;
    HttpClient& _http;
    std::chrono::milliseconds _timeout;
};

} // namespace mcpmux
