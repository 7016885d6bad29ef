// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/HttpClient.hpp>

namespace mcpmux
{

/// @brief HttpClient backed by the libcurl easy interface.
///
/// Every perform() call uses its own easy handle, so one instance may be shared by
/// several transports and threads.
class CurlHttpClient: public HttpClient
{
  public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    [[nodiscard]] auto perform(const HttpRequest& request) -> Result<HttpResponse> override;
};

} // namespace mcpmux
