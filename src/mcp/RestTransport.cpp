// SPDX-License-Identifier: Apache-2.0
#include "RestTransport.hpp"

#include <core/Log.hpp>
#include <mcp/ResultNormalizer.hpp>

#include <curl/curl.h>

#include <format>
#include <memory>
#include <new>

namespace mcpmux
{

auto urlEncode(std::string_view text) -> std::string
{
    // curl_easy_escape() falls back to strlen() for a zero length.
    if (text.empty())
        return {};

    auto const escaped = std::unique_ptr<char, decltype(&curl_free)>(
        curl_easy_escape(nullptr, text.data(), static_cast<int>(text.size())), &curl_free);
    if (!escaped)
        throw std::bad_alloc();
    return std::string(escaped.get());
}

auto buildQueryString(const nlohmann::json& arguments) -> std::string
{
    auto query = std::string {};
    if (!arguments.is_object())
        return query;

    for (const auto& [key, value]: arguments.items())
    {
        if (value.is_null())
            continue;
        if (!query.empty())
            query += '&';
        query += urlEncode(key);
        query += '=';
        query += urlEncode(value.is_string() ? value.get<std::string>() : dumpJson(value));
    }
    return query;
}

RestTransport::RestTransport(std::string baseUrl,
                             std::map<std::string, std::string> endpoints,
                             HttpClient& http,
                             std::chrono::milliseconds timeout):
    _baseUrl(std::move(baseUrl)), _endpoints(std::move(endpoints)), _http(http), _timeout(timeout)
{
}

auto RestTransport::toolNames() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    names.reserve(_endpoints.size());
    for (const auto& [name, path]: _endpoints)
        names.push_back(name);
    return names;
}

auto RestTransport::callTool(std::string_view tool, const nlohmann::json& arguments) -> Result<std::string>
{
    auto const it = _endpoints.find(std::string(tool));
    if (it == _endpoints.end())
        return makeError(ErrorCode::UnknownTool, std::format("Unknown tool: {}", tool));

    auto url = _baseUrl + it->second;
    if (auto const query = buildQueryString(arguments); !query.empty())
        url += std::format("{}{}", url.find('?') == std::string::npos ? '?' : '&', query);

    log::debug("GET {}", url);
    auto response = _http.perform(HttpRequest {
        .method = HttpMethod::Get,
        .url = url,
        .headers = {},
        .body = {},
        .timeout = _timeout,
    });
    if (!response)
        return std::unexpected(response.error());

    if (!response->isSuccess())
    {
        return makeError(ErrorCode::RemoteError,
                         std::format("HTTP {} from {}: {}", response->status, url,
                                     truncateText(normalizeBytes(response->body), 200)));
    }

    return normalizeBytes(response->body);
}

} // namespace mcpmux
