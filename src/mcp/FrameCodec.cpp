// SPDX-License-Identifier: Apache-2.0
#include "FrameCodec.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>

namespace mcpmux::framing
{

namespace
{

    constexpr auto HeaderTerminator = std::string_view { "\r\n\r\n" };
    constexpr auto ContentLengthName = std::string_view { "content-length" };

    auto equalsIgnoreCase(char a, char b) -> bool
    {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    }

    auto trim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    /// @brief Finds the next `Content-Length` header name, ignoring case.
    auto findContentLength(std::string_view buffer) -> std::size_t
    {
        auto const it = std::search(
            buffer.begin(), buffer.end(), ContentLengthName.begin(), ContentLengthName.end(), equalsIgnoreCase);
        if (it == buffer.end())
            return std::string_view::npos;
        return static_cast<std::size_t>(it - buffer.begin());
    }

    /// @brief Parses the header block (without terminator) and returns the announced body length.
    auto parseContentLength(std::string_view header) -> Result<std::size_t>
    {
        auto length = std::optional<std::size_t> {};

        while (!header.empty())
        {
            auto const eol = header.find("\r\n");
            auto const line = header.substr(0, eol);
            header = eol == std::string_view::npos ? std::string_view {} : header.substr(eol + 2);

            auto const colon = line.find(':');
            if (colon == std::string_view::npos)
                return makeError(ErrorCode::FramingError, std::format("Malformed header line: '{}'", line));

            auto const name = trim(line.substr(0, colon));
            if (!std::ranges::equal(name, ContentLengthName, equalsIgnoreCase))
                continue;

            auto const value = trim(line.substr(colon + 1));
            auto parsed = std::size_t { 0 };
            auto const [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (ec != std::errc {} || ptr != value.data() + value.size() || value.empty())
                return makeError(ErrorCode::FramingError, std::format("Invalid Content-Length: '{}'", value));
            length = parsed;
        }

        if (!length)
            return makeError(ErrorCode::FramingError, "Missing Content-Length header");
        if (*length > MaxContentLength)
            return makeError(ErrorCode::FramingError,
                             std::format("Content-Length {} exceeds limit of {} bytes", *length, MaxContentLength));
        return *length;
    }

} // namespace

auto encodeFrame(const nlohmann::json& message) -> std::string
{
    auto const body = message.dump();
    return std::format("Content-Length: {}\r\n\r\n{}", body.size(), body);
}

void FrameDecoder::feed(std::string_view bytes)
{
    _buffer.append(bytes);
}

auto FrameDecoder::next() -> std::optional<Result<nlohmann::json>>
{
    if (_resyncing && !resynchronize())
        return std::nullopt;

    // Tolerate stray line breaks between frames.
    auto const start = _buffer.find_first_not_of("\r\n");
    if (start == std::string::npos)
    {
        _buffer.clear();
        return std::nullopt;
    }
    if (start > 0)
        _buffer.erase(0, start);

    auto const headerEnd = _buffer.find(HeaderTerminator);
    if (headerEnd == std::string::npos)
    {
        if (_buffer.size() > MaxHeaderLength)
            return fail(1, std::format("No header terminator within {} bytes", MaxHeaderLength));
        return std::nullopt;
    }

    auto const bodyStart = headerEnd + HeaderTerminator.size();
    auto length = parseContentLength(std::string_view(_buffer).substr(0, headerEnd));
    if (!length)
        return fail(bodyStart, std::move(length.error().message));

    if (_buffer.size() - bodyStart < *length)
        return std::nullopt;

    auto const body = std::string_view(_buffer).substr(bodyStart, *length);
    auto message = nlohmann::json::parse(body, nullptr, false);
    _buffer.erase(0, bodyStart + *length);

    if (message.is_discarded())
        return makeError(ErrorCode::FramingError, std::format("Frame body of {} bytes is not valid JSON", *length));

    return message;
}

auto FrameDecoder::decode(const ReadFunction& read) -> Result<nlohmann::json>
{
    auto chunk = std::array<char, 4096> {};
    while (true)
    {
        if (auto frame = next())
            return std::move(*frame);

        auto bytesRead = read(chunk);
        if (!bytesRead)
            return std::unexpected(bytesRead.error());

        if (*bytesRead == 0)
        {
            if (_buffer.empty())
                return makeError(ErrorCode::TransportError, "End of stream");
            return makeError(ErrorCode::FramingError,
                             std::format("End of stream inside a frame ({} bytes buffered)", _buffer.size()));
        }

        feed(std::string_view(chunk.data(), *bytesRead));
    }
}

auto FrameDecoder::bufferedSize() const noexcept -> std::size_t
{
    return _buffer.size();
}

void FrameDecoder::reset()
{
    _buffer.clear();
    _resyncing = false;
}

auto FrameDecoder::resynchronize() -> bool
{
    auto const pos = findContentLength(_buffer);
    if (pos == std::string::npos)
    {
        // Keep a tail that could be the beginning of a split header name.
        auto const keep = std::min(_buffer.size(), ContentLengthName.size() - 1);
        _buffer.erase(0, _buffer.size() - keep);
        return false;
    }

    if (pos > 0)
        log::debug("Framing: skipped {} bytes while resynchronizing", pos);
    _buffer.erase(0, pos);
    _resyncing = false;
    return true;
}

auto FrameDecoder::fail(std::size_t consumed, std::string message) -> Result<nlohmann::json>
{
    _buffer.erase(0, std::min(consumed, _buffer.size()));
    _resyncing = true;
    return makeError(ErrorCode::FramingError, std::move(message));
}

} // namespace mcpmux::framing
