// SPDX-License-Identifier: Apache-2.0
#include <mcp/FrameCodec.hpp>
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstring>
#include <format>

using namespace mcpmux;
using namespace mcpmux::framing;

namespace
{

/// @brief ReadFunction that serves @p data in chunks of at most @p chunkSize bytes.
auto chunkedReader(std::string data, std::size_t chunkSize) -> ReadFunction
{
    return [data = std::move(data), chunkSize, offset = std::size_t { 0 }](std::span<char> buffer) mutable
           -> Result<std::size_t> {
        auto const count = std::min({ chunkSize, buffer.size(), data.size() - offset });
        std::memcpy(buffer.data(), data.data() + offset, count);
        offset += count;
        return count;
    };
}

} // namespace

TEST_CASE("encodeFrame prefixes the compact body with its byte length", "[framing]")
{
    auto const frame = encodeFrame(nlohmann::json { { "a", 1 } });
    CHECK(frame == "Content-Length: 7\r\n\r\n{\"a\":1}");
}

TEST_CASE("encodeFrame counts bytes, not characters", "[framing]")
{
    auto const frame = encodeFrame(nlohmann::json("\xC3\xA9")); // "é"
    CHECK(frame == "Content-Length: 4\r\n\r\n\"\xC3\xA9\"");
}

TEST_CASE("FrameDecoder decodes an encoded request", "[framing]")
{
    auto const request = jsonrpc::makeRequest(3, "tools/call", { { "name", "echo" } });

    auto decoder = FrameDecoder {};
    decoder.feed(encodeFrame(request));
    auto frame = decoder.next();

    REQUIRE(frame.has_value());
    REQUIRE(frame->has_value());
    CHECK(**frame == request);
    CHECK(decoder.bufferedSize() == 0);
    CHECK(!decoder.next().has_value());
}

TEST_CASE("FrameDecoder yields nothing for an incomplete frame", "[framing]")
{
    auto const frame = encodeFrame(nlohmann::json { { "key", "value" } });

    auto decoder = FrameDecoder {};
    decoder.feed(std::string_view(frame).substr(0, frame.size() - 1));
    CHECK(!decoder.next().has_value());

    decoder.feed(std::string_view(frame).substr(frame.size() - 1));
    auto message = decoder.next();
    REQUIRE(message.has_value());
    REQUIRE(message->has_value());
    CHECK((**message)["key"] == "value");
}

TEST_CASE("FrameDecoder byte-by-byte delivery matches single-chunk delivery", "[framing]")
{
    auto const message = jsonrpc::makeResult(9, { { "content", { { { "type", "text" }, { "text", "h\xC3\xA9llo" } } } } });
    auto const bytes = encodeFrame(message) + encodeFrame(jsonrpc::makeNotification("done"));

    auto whole = FrameDecoder {};
    auto const first = whole.decode(chunkedReader(bytes, bytes.size()));
    auto const second = whole.decode(chunkedReader({}, 1));

    auto split = FrameDecoder {};
    auto reader = chunkedReader(bytes, 1);
    auto const firstSplit = split.decode(reader);
    auto const secondSplit = split.decode(reader);

    REQUIRE(first.has_value());
    REQUIRE(firstSplit.has_value());
    CHECK(*first == message);
    CHECK(*firstSplit == *first);
    REQUIRE(second.has_value());
    REQUIRE(secondSplit.has_value());
    CHECK(*secondSplit == *second);
}

TEST_CASE("FrameDecoder ignores other headers and matches Content-Length case-insensitively", "[framing]")
{
    auto decoder = FrameDecoder {};
    decoder.feed("Content-Type: application/vscode-jsonrpc; charset=utf-8\r\n"
                 "content-length: 2\r\n"
                 "\r\n"
                 "{}");

    auto message = decoder.next();
    REQUIRE(message.has_value());
    REQUIRE(message->has_value());
    CHECK(**message == nlohmann::json::object());
}

TEST_CASE("FrameDecoder reports a missing Content-Length and recovers", "[framing]")
{
    auto decoder = FrameDecoder {};
    decoder.feed("X-Other: 1\r\n\r\ngarbage" + encodeFrame(nlohmann::json { { "ok", true } }));

    auto broken = decoder.next();
    REQUIRE(broken.has_value());
    REQUIRE(!broken->has_value());
    CHECK(broken->error().code == ErrorCode::FramingError);

    auto recovered = decoder.next();
    REQUIRE(recovered.has_value());
    REQUIRE(recovered->has_value());
    CHECK((**recovered)["ok"] == true);
}

TEST_CASE("FrameDecoder rejects an unparsable length", "[framing]")
{
    auto decoder = FrameDecoder {};
    decoder.feed("Content-Length: twelve\r\n\r\n");

    auto frame = decoder.next();
    REQUIRE(frame.has_value());
    REQUIRE(!frame->has_value());
    CHECK(frame->error().code == ErrorCode::FramingError);
}

TEST_CASE("FrameDecoder rejects an oversized length", "[framing]")
{
    auto decoder = FrameDecoder {};
    decoder.feed(std::format("Content-Length: {}\r\n\r\n", MaxContentLength + 1));

    auto frame = decoder.next();
    REQUIRE(frame.has_value());
    REQUIRE(!frame->has_value());
    CHECK(frame->error().code == ErrorCode::FramingError);
}

TEST_CASE("FrameDecoder reports an invalid JSON body and continues with the next frame", "[framing]")
{
    auto decoder = FrameDecoder {};
    decoder.feed("Content-Length: 5\r\n\r\n{oops" + encodeFrame(nlohmann::json(42)));

    auto broken = decoder.next();
    REQUIRE(broken.has_value());
    REQUIRE(!broken->has_value());
    CHECK(broken->error().code == ErrorCode::FramingError);

    auto next = decoder.next();
    REQUIRE(next.has_value());
    REQUIRE(next->has_value());
    CHECK(**next == 42);
}

TEST_CASE("FrameDecoder::decode distinguishes clean end of stream from a truncated frame", "[framing]")
{
    auto clean = FrameDecoder {};
    auto const eof = clean.decode(chunkedReader({}, 16));
    REQUIRE(!eof.has_value());
    CHECK(eof.error().code == ErrorCode::TransportError);

    auto truncated = FrameDecoder {};
    auto const partial = truncated.decode(chunkedReader("Content-Length: 10\r\n\r\n{\"a\"", 4));
    REQUIRE(!partial.has_value());
    CHECK(partial.error().code == ErrorCode::FramingError);
}

TEST_CASE("FrameDecoder::decode propagates read errors", "[framing]")
{
    auto decoder = FrameDecoder {};
    auto const result = decoder.decode([](std::span<char>) -> Result<std::size_t> {
        return makeError(ErrorCode::IoError, "disk on fire");
    });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
}
