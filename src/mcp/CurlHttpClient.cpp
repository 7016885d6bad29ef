// SPDX-License-Identifier: Apache-2.0
#include "CurlHttpClient.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <format>
#include <memory>
#include <mutex>

namespace mcpmux
{

namespace
{

    auto curlInitFlag = std::once_flag {};

    struct EasyHandleDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct HeaderListDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;
    using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

    auto writeBody(char* data, size_t size, size_t count, void* userdata) -> size_t
    {
        auto* body = static_cast<std::string*>(userdata);
        body->append(data, size * count);
        return size * count;
    }

    auto mapCurlError(CURLcode code, const std::string& url) -> Error
    {
        auto const message = std::format("HTTP request to {} failed: {}", url, curl_easy_strerror(code));
        if (code == CURLE_OPERATION_TIMEDOUT)
            return Error { ErrorCode::TimeoutError, message };
        return Error { ErrorCode::TransportError, message };
    }

} // namespace

CurlHttpClient::CurlHttpClient()
{
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpClient::~CurlHttpClient() = default;

auto CurlHttpClient::perform(const HttpRequest& request) -> Result<HttpResponse>
{
    auto handle = EasyHandle(curl_easy_init());
    if (!handle)
        return makeError(ErrorCode::TransportError, "Failed to create curl handle");

    auto headers = HeaderList {};
    for (const auto& [name, value]: request.headers)
    {
        auto const line = std::format("{}: {}", name, value);
        auto* appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended)
            return makeError(ErrorCode::TransportError, "Failed to build request headers");
        (void) headers.release();
        headers.reset(appended);
    }

    auto response = HttpResponse {};
    auto* curl = handle.get();

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (headers)
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    if (request.method == HttpMethod::Post)
    {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
    else
    {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    log::trace("HTTP {} {}", request.method == HttpMethod::Post ? "POST" : "GET", request.url);

    auto const code = curl_easy_perform(curl);
    if (code != CURLE_OK)
        return std::unexpected(mapCurlError(code, request.url));

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    log::trace("HTTP {} -> {} ({} bytes)", request.url, response.status, response.body.size());
    return response;
}

} // namespace mcpmux
