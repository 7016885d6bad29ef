// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace mcpmux
{

/// @brief Converts a backend response value into display text.
///
/// The policy is applied in this order:
///  1. an object with a non-empty `content` array: each block's `text`, or the block
///     serialized to JSON when it has none, joined with newlines;
///  2. an object with a `data` member: the member serialized to JSON;
///  3. binary data: decoded as UTF-8, invalid sequences replaced by U+FFFD;
///  4. a string: returned unchanged;
///  5. anything else: serialized to JSON.
/// A null value yields an empty string.
/// @param value The backend response.
/// @return The normalized text. Never fails.
[[nodiscard]] auto normalizeResult(const nlohmann::json& value) -> std::string;

/// @brief Normalizes a raw byte payload (rule 3 of normalizeResult()).
[[nodiscard]] auto normalizeBytes(std::span<const std::byte> bytes) -> std::string;

/// @brief Normalizes a raw byte payload held in a string (rule 3 of normalizeResult()).
[[nodiscard]] auto normalizeBytes(std::string_view bytes) -> std::string;

/// @brief Serializes JSON compactly, replacing invalid UTF-8 instead of throwing.
[[nodiscard]] auto dumpJson(const nlohmann::json& value) -> std::string;

/// @brief Shortens @p text to at most @p maxBytes bytes plus @p suffix.
///
/// The cut never splits a UTF-8 sequence. Text that already fits is returned unchanged.
[[nodiscard]] auto truncateText(std::string_view text, std::size_t maxBytes, std::string_view suffix = "...")
    -> std::string;

} // namespace mcpmux
