// SPDX-License-Identifier: Apache-2.0
#include "ResultNormalizer.hpp"

#include <cstdint>

namespace mcpmux
{

namespace
{

    constexpr auto ReplacementCharacter = std::string_view { "\xEF\xBF\xBD" };

    auto isContinuation(unsigned char byte) -> bool
    {
        return (byte & 0xC0) == 0x80;
    }

    /// @brief Returns the length of the valid UTF-8 sequence starting at @p pos, or 0 if invalid.
    auto validSequenceLength(std::string_view bytes, std::size_t pos) -> std::size_t
    {
        auto const lead = static_cast<unsigned char>(bytes[pos]);
        auto const remaining = bytes.size() - pos;

        if (lead < 0x80)
            return 1;

        auto length = std::size_t { 0 };
        auto codepoint = std::uint32_t { 0 };
        if (lead >= 0xC2 && lead <= 0xDF)
        {
            length = 2;
            codepoint = lead & 0x1F;
        }
        else if (lead >= 0xE0 && lead <= 0xEF)
        {
            length = 3;
            codepoint = lead & 0x0F;
        }
        else if (lead >= 0xF0 && lead <= 0xF4)
        {
            length = 4;
            codepoint = lead & 0x07;
        }
        else
        {
            return 0;
        }

        if (remaining < length)
            return 0;

        for (auto i = std::size_t { 1 }; i < length; ++i)
        {
            auto const byte = static_cast<unsigned char>(bytes[pos + i]);
            if (!isContinuation(byte))
                return 0;
            codepoint = (codepoint << 6) | (byte & 0x3F);
        }

        // Reject overlong forms, UTF-16 surrogates and values beyond U+10FFFF.
        if ((length == 3 && codepoint < 0x800) || (length == 4 && codepoint < 0x10000))
            return 0;
        if (codepoint >= 0xD800 && codepoint <= 0xDFFF)
            return 0;
        if (codepoint > 0x10FFFF)
            return 0;

        return length;
    }

    auto textOfBlock(const nlohmann::json& block) -> std::string
    {
        if (block.is_string())
            return block.get<std::string>();
        if (block.is_object() && block.contains("text") && block["text"].is_string())
            return block["text"].get<std::string>();
        return dumpJson(block);
    }

} // namespace

auto normalizeResult(const nlohmann::json& value) -> std::string
{
    if (value.is_null())
        return {};

    if (value.is_object())
    {
        if (auto const it = value.find("content"); it != value.end() && it->is_array() && !it->empty())
        {
            auto text = std::string {};
            for (const auto& block: *it)
            {
                if (&block != &it->front())
                    text += '\n';
                text += textOfBlock(block);
            }
            return text;
        }

        if (auto const it = value.find("data"); it != value.end())
            return dumpJson(*it);
    }

    if (value.is_binary())
    {
        auto const& binary = value.get_binary();
        return normalizeBytes(std::as_bytes(std::span(binary.data(), binary.size())));
    }

    if (value.is_string())
        return value.get<std::string>();

    return dumpJson(value);
}

auto normalizeBytes(std::span<const std::byte> bytes) -> std::string
{
    return normalizeBytes(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

auto normalizeBytes(std::string_view bytes) -> std::string
{
    auto text = std::string {};
    text.reserve(bytes.size());

    auto pos = std::size_t { 0 };
    while (pos < bytes.size())
    {
        auto const length = validSequenceLength(bytes, pos);
        if (length == 0)
        {
            text += ReplacementCharacter;
            ++pos;
            continue;
        }
        text.append(bytes.substr(pos, length));
        pos += length;
    }
    return text;
}

auto dumpJson(const nlohmann::json& value) -> std::string
{
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto truncateText(std::string_view text, std::size_t maxBytes, std::string_view suffix) -> std::string
{
    if (text.size() <= maxBytes)
        return std::string(text);

    auto cut = maxBytes;
    while (cut > 0 && isContinuation(static_cast<unsigned char>(text[cut])))
        --cut;

    auto result = std::string(text.substr(0, cut));
    result += suffix;
    return result;
}

} // namespace mcpmux
