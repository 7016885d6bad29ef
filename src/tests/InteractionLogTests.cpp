// SPDX-License-Identifier: Apache-2.0
#include <mcp/InteractionLog.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>

using namespace mcpmux;

TEST_CASE("InteractionLog records connections and tool calls", "[interactions]")
{
    auto interactions = InteractionLog(10);
    interactions.onServerConnection("weather", "rest", true, 2, "");
    interactions.onServerConnection("broken", "process", false, 0, "spawn failed");
    interactions.onToolCall("weather", "forecast", { { "city", "Oslo" } }, "Rain", true, "");
    interactions.onToolCall("weather", "radar", nlohmann::json::object(), "", false, "Unknown tool");

    CHECK(interactions.size() == 4);

    auto const summary = interactions.summary();
    CHECK(summary.total == 4);
    CHECK(summary.connections == 2);
    CHECK(summary.connected == 1);
    CHECK(summary.failedConnections == 1);
    CHECK(summary.toolCalls == 2);
    CHECK(summary.successfulCalls == 1);
    CHECK(summary.failedCalls == 1);

    auto const recent = interactions.recent(2);
    REQUIRE(recent.size() == 2);
    CHECK(recent[0].detail == "forecast");
    CHECK(recent[0].arguments["city"] == "Oslo");
    CHECK(recent[0].result == "Rain");
    CHECK(recent[1].detail == "radar");
    CHECK(recent[1].error == "Unknown tool");
}

TEST_CASE("InteractionLog evicts the oldest entries beyond its capacity", "[interactions]")
{
    auto interactions = InteractionLog(3);
    for (auto i = 0; i < 5; ++i)
        interactions.onToolCall("s", std::format("tool{}", i), nlohmann::json::object(), "ok", true, "");

    CHECK(interactions.size() == 3);
    CHECK(interactions.capacity() == 3);

    auto const recent = interactions.recent(10);
    REQUIRE(recent.size() == 3);
    CHECK(recent[0].detail == "tool2");
    CHECK(recent[2].detail == "tool4");

    interactions.clear();
    CHECK(interactions.size() == 0);
}

TEST_CASE("InteractionLog keeps a bounded result excerpt", "[interactions]")
{
    auto interactions = InteractionLog();
    interactions.onToolCall("s", "t", nlohmann::json::object(), std::string(2000, 'x'), true, "");

    auto const recent = interactions.recent(1);
    REQUIRE(recent.size() == 1);
    CHECK(recent[0].result.size() == InteractionLog::ResultExcerptLength);
}

TEST_CASE("formatInteraction renders calls and connections", "[interactions]")
{
    auto interactions = InteractionLog();
    interactions.onServerConnection("weather", "rest", true, 2, "");
    interactions.onServerConnection("broken", "process", false, 0, "spawn failed");
    interactions.onToolCall("weather", "forecast", { { "city", "Oslo" } }, "Rain", true, "");
    interactions.onToolCall("weather", "radar", nlohmann::json::object(), "", false, "Unknown tool");

    auto const recent = interactions.recent(4);
    REQUIRE(recent.size() == 4);

    auto const connected = formatInteraction(recent[0]);
    CHECK(connected.starts_with("OK  "));
    CHECK(connected.find("server weather (rest): 2 tools") != std::string::npos);

    CHECK(formatInteraction(recent[1]).find("spawn failed") != std::string::npos);

    auto const call = formatInteraction(recent[2]);
    CHECK(call.find("weather.forecast") != std::string::npos);
    CHECK(call.find(R"(Params: {"city":"Oslo"})") != std::string::npos);
    CHECK(call.find("Result: Rain") != std::string::npos);

    auto const failed = formatInteraction(recent[3]);
    CHECK(failed.starts_with("FAIL"));
    CHECK(failed.find("Error: Unknown tool") != std::string::npos);
}
