// SPDX-License-Identifier: Apache-2.0
#include <mcp/ResultNormalizer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstddef>

using namespace mcpmux;

TEST_CASE("normalizeResult joins content text blocks with newlines", "[normalizer]")
{
    auto const value = nlohmann::json::parse(R"({"content": [{"text": "a"}, {"text": "b"}]})");
    CHECK(normalizeResult(value) == "a\nb");
}

TEST_CASE("normalizeResult serializes content blocks without text", "[normalizer]")
{
    auto const value = nlohmann::json::parse(R"({"content": [{"type": "image", "mimeType": "image/png"}, "plain"]})");
    CHECK(normalizeResult(value) == "{\"mimeType\":\"image/png\",\"type\":\"image\"}\nplain");
}

TEST_CASE("normalizeResult serializes the data member", "[normalizer]")
{
    auto const value = nlohmann::json::parse(R"({"data": {"r": 255, "g": 0}})");
    CHECK(normalizeResult(value) == "{\"g\":0,\"r\":255}");
}

TEST_CASE("normalizeResult prefers content over data", "[normalizer]")
{
    auto const value = nlohmann::json::parse(R"({"content": [{"text": "first"}], "data": 1})");
    CHECK(normalizeResult(value) == "first");
}

TEST_CASE("normalizeResult falls through an empty content array", "[normalizer]")
{
    auto const value = nlohmann::json::parse(R"({"content": [], "data": [1, 2]})");
    CHECK(normalizeResult(value) == "[1,2]");
}

TEST_CASE("normalizeResult returns strings unchanged", "[normalizer]")
{
    CHECK(normalizeResult(nlohmann::json("hello")) == "hello");
    CHECK(normalizeResult(nlohmann::json("")) == "");
}

TEST_CASE("normalizeResult maps null to an empty string", "[normalizer]")
{
    CHECK(normalizeResult(nlohmann::json {}) == "");
}

TEST_CASE("normalizeResult serializes other values", "[normalizer]")
{
    CHECK(normalizeResult(nlohmann::json(42)) == "42");
    CHECK(normalizeResult(nlohmann::json(true)) == "true");
    CHECK(normalizeResult(nlohmann::json::parse(R"({"status": "ok"})")) == "{\"status\":\"ok\"}");
}

TEST_CASE("normalizeResult is idempotent on strings", "[normalizer]")
{
    for (auto const* text: { "plain", "a\nb", "{\"json\": true}", "caf\xC3\xA9", "" })
    {
        auto const once = normalizeResult(nlohmann::json(text));
        CHECK(normalizeResult(nlohmann::json(once)) == once);
    }
}

TEST_CASE("normalizeResult decodes binary values with replacement", "[normalizer]")
{
    auto const value = nlohmann::json::binary({ 'c', 'a', 'f', 0xE9 });
    CHECK(normalizeResult(value) == "caf\xEF\xBF\xBD");
}

TEST_CASE("normalizeBytes replaces an invalid UTF-8 tail instead of failing", "[normalizer]")
{
    auto const bytes = std::array { std::byte { 'c' }, std::byte { 'a' }, std::byte { 'f' }, std::byte { 0xE9 } };
    auto const text = normalizeBytes(std::span<const std::byte>(bytes));
    CHECK(text == "caf\xEF\xBF\xBD");
}

TEST_CASE("normalizeBytes keeps valid multi-byte sequences", "[normalizer]")
{
    CHECK(normalizeBytes(std::string_view("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80")) ==
          "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
}

TEST_CASE("normalizeBytes rejects overlong forms and surrogates", "[normalizer]")
{
    // Overlong '/' (C0 AF) and an encoded surrogate (ED A0 80): each byte is replaced.
    CHECK(normalizeBytes(std::string_view("\xC0\xAF")) == "\xEF\xBF\xBD\xEF\xBF\xBD");
    CHECK(normalizeBytes(std::string_view("\xED\xA0\x80")) == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("dumpJson does not throw on invalid UTF-8 in strings", "[normalizer]")
{
    auto const value = nlohmann::json { { "text", std::string("caf\xE9") } };
    CHECK(dumpJson(value) == "{\"text\":\"caf\xEF\xBF\xBD\"}");
}

TEST_CASE("truncateText keeps short text and cuts long text with a suffix", "[normalizer]")
{
    CHECK(truncateText("short", 10) == "short");
    CHECK(truncateText("0123456789abc", 10) == "0123456789...");
    CHECK(truncateText("0123456789abc", 10, "") == "0123456789");
}

TEST_CASE("truncateText never splits a UTF-8 sequence", "[normalizer]")
{
    // "é" occupies bytes 4 and 5; a cut at 5 must back off to 4.
    CHECK(truncateText("abcd\xC3\xA9xyz", 5) == "abcd...");
}
