// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace mcpmux
{

/// @brief HTTP method of an HttpRequest.
enum class HttpMethod
{
    Get,
    Post,
};

/// @brief A single HTTP request.
struct HttpRequest
{
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout { 10'000 };
};

/// @brief The status and body of an HTTP response.
struct HttpResponse
{
    long status = 0;
    std::string body;

    /// @brief Returns true for 2xx status codes.
    [[nodiscard]] auto isSuccess() const -> bool { return status >= 200 && status < 300; }
};

/// @brief Abstract interface for synchronous HTTP request/response exchanges.
///
/// Implementations must allow concurrent perform() calls from different threads.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    /// @brief Performs one request and waits for the complete response.
    /// @param request The request to send.
    /// @return The response (any status code), a TimeoutError, or a TransportError.
    [[nodiscard]] virtual auto perform(const HttpRequest& request) -> Result<HttpResponse> = 0;
};

} // namespace mcpmux
