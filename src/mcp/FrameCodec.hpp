// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mcpmux::framing
{

/// @brief Largest body a single frame may announce.
constexpr auto MaxContentLength = std::size_t { 64 } * 1024 * 1024;

/// @brief Largest header block accepted before the terminating blank line.
constexpr auto MaxHeaderLength = std::size_t { 8 } * 1024;

/// @brief Encodes a message as `Content-Length: N\r\n\r\n<body>`.
/// @param message The JSON message; serialized compactly.
/// @return The framed bytes.
[[nodiscard]] auto encodeFrame(const nlohmann::json& message) -> std::string;

/// @brief Pulls up to `buffer.size()` bytes from a stream.
///
/// Returns the number of bytes written into @p buffer, 0 at end of stream, or an error.
using ReadFunction = std::function<Result<std::size_t>(std::span<char> buffer)>;

/// @brief Incremental decoder for Content-Length framed JSON messages.
///
/// Bytes may be fed in chunks of any size; the decoder accumulates them across calls
/// and never assumes one read yields a whole frame. After a malformed frame it drops
/// the offending bytes and resumes at the next `Content-Length` header it finds.
class FrameDecoder
{
  public:
    /// @brief Appends raw bytes received from the stream.
    void feed(std::string_view bytes);

    /// @brief Extracts the next complete frame from the buffered bytes.
    /// @return std::nullopt if more bytes are needed, otherwise the decoded message or a
    ///         FramingError describing the frame that was discarded.
    [[nodiscard]] auto next() -> std::optional<Result<nlohmann::json>>;

    /// @brief Reads from @p read until exactly one frame has been decoded.
    /// @param read The byte source; may deliver any number of bytes per call.
    /// @return The decoded message, a FramingError, or the read error.
    [[nodiscard]] auto decode(const ReadFunction& read) -> Result<nlohmann::json>;

    /// @brief Returns the number of buffered bytes not yet consumed.
    [[nodiscard]] auto bufferedSize() const noexcept -> std::size_t;

    /// @brief Discards all buffered bytes and any pending resynchronization.
    void reset();

  private:
    std::string _buffer;
    bool _resyncing = false;

    [[nodiscard]] auto resynchronize() -> bool;
    [[nodiscard]] auto fail(std::size_t consumed, std::string message) -> Result<nlohmann::json>;
};

} // namespace mcpmux::framing
