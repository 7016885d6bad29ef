// SPDX-License-Identifier: Apache-2.0
#include <agent/Orchestrator.hpp>

#include "support/FakeHttpClient.hpp"
#include "support/ScriptedLlm.hpp"

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>

using namespace mcpmux;
using namespace std::chrono_literals;
using test::FakeHttpClient;
using test::ScriptedLlm;
using test::textBlock;
using test::toolUseBlock;

namespace
{

/// @brief LLM, one REST weather backend and a conversation wired to an orchestrator.
struct Fixture
{
    ScriptedLlm llmHttp;
    FakeHttpClient backendHttp { [](const HttpRequest& request) -> Result<HttpResponse> {
        return HttpResponse { .status = 200, .body = "Rain at " + request.url };
    } };
    LlmClient llm { LlmClientConfig { .endpoint = "http://llm.local",
                                      .apiKey = "sk-test",
                                      .model = "claude-test",
                                      .maxTokens = 100,
                                      .timeout = 1s },
                    llmHttp };
    ToolRegistry registry;
    Conversation conversation;

    Fixture()
    {
        auto config = BackendConfig {};
        config.name = "weather";
        config.kind = BackendKind::Rest;
        config.baseUrl = "http://weather.local";
        config.endpoints = { { "forecast", "/forecast" } };

        auto client = makeToolClient(config, backendHttp, nullptr);
        REQUIRE(client.has_value());
        REQUIRE((*client)->initialize().has_value());
        REQUIRE(registry.registerClient("weather", std::move(*client)).has_value());
    }

    auto orchestrator(OrchestratorConfig config = {}) -> Orchestrator
    {
        return Orchestrator(llm, registry, conversation, std::move(config));
    }
};

auto reply(std::initializer_list<nlohmann::json> blocks) -> HttpResponse
{
    auto content = nlohmann::json::array();
    for (const auto& block: blocks)
        content.push_back(block);
    return test::llmResponse(std::move(content));
}

} // namespace

TEST_CASE("defaultSystemPrompt lists the services", "[orchestrator]")
{
    auto const services = std::vector<std::string> { "weather", "files" };
    auto const prompt = defaultSystemPrompt(services);
    CHECK(prompt.starts_with("You are a helpful assistant"));
    CHECK(prompt.find("Available services: ['weather', 'files']") != std::string::npos);
}

TEST_CASE("Orchestrator answers without tools", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.llmHttp.enqueue(reply({ textBlock("Hello there") }));
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator.processMessage("Hi");
    REQUIRE(result.has_value());
    CHECK(*result == "Hello there");

    REQUIRE(fixture.llmHttp.requestCount() == 1);
    auto const body = fixture.llmHttp.body(0);
    CHECK(body["system"].get<std::string>().find("'weather'") != std::string::npos);
    REQUIRE(body["tools"].size() == 1);
    CHECK(body["tools"][0]["name"] == "forecast");
    CHECK(body["messages"] == nlohmann::json::array({ { { "role", "user" }, { "content", "Hi" } } }));

    REQUIRE(fixture.conversation.size() == 2);
    CHECK(fixture.conversation.turns()[0].text == "Hi");
    CHECK(fixture.conversation.turns()[1].text == "Hello there");
    CHECK(fixture.backendHttp.requestCount() == 0);
}

TEST_CASE("Orchestrator feeds tool results back to the LLM", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.llmHttp.enqueue(
        reply({ textBlock("Let me check."), toolUseBlock("tu_1", "forecast", { { "city", "Oslo" } }) }));
    fixture.llmHttp.enqueue(reply({ textBlock("It rains in Oslo.") }));
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator.processMessage("Weather in Oslo?");
    REQUIRE(result.has_value());
    CHECK(*result == "Let me check.\n\nIt rains in Oslo.");

    auto const backendRequests = fixture.backendHttp.requests();
    REQUIRE(backendRequests.size() == 1);
    CHECK(backendRequests[0].url == "http://weather.local/forecast?city=Oslo");

    REQUIRE(fixture.llmHttp.requestCount() == 2);
    auto const messages = fixture.llmHttp.body(1)["messages"];
    REQUIRE(messages.size() == 3);
    CHECK(messages[1]["role"] == "assistant");
    CHECK(messages[1]["content"][1]["type"] == "tool_use");
    CHECK(messages[1]["content"][1]["id"] == "tu_1");
    CHECK(messages[2]["role"] == "user");
    CHECK(messages[2]["content"][0]["type"] == "tool_result");
    CHECK(messages[2]["content"][0]["tool_use_id"] == "tu_1");
    CHECK(messages[2]["content"][0]["content"] == "Rain at http://weather.local/forecast?city=Oslo");
    CHECK(!messages[2]["content"][0].contains("is_error"));

    // Only the user text and the final reply enter the conversation.
    REQUIRE(fixture.conversation.size() == 2);
    CHECK(fixture.conversation.turns()[1].text == *result);
}

TEST_CASE("Orchestrator truncates long tool results", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.llmHttp.enqueue(reply({ toolUseBlock("tu_1", "forecast", nlohmann::json::object()) }));
    auto orchestrator = fixture.orchestrator(OrchestratorConfig { .maxResultLength = 10 });

    REQUIRE(orchestrator.processMessage("Weather?").has_value());

    auto const messages = fixture.llmHttp.body(1)["messages"];
    CHECK(messages[2]["content"][0]["content"] == "Rain at ht...");
}

TEST_CASE("Orchestrator reports unknown tools to the LLM", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.llmHttp.enqueue(reply({ toolUseBlock("tu_1", "teleport", { { "to", "Mars" } }) }));
    fixture.llmHttp.enqueue(reply({ textBlock("I cannot do that.") }));
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator.processMessage("Beam me up");
    REQUIRE(result.has_value());
    CHECK(*result == "I cannot do that.");
    CHECK(fixture.backendHttp.requestCount() == 0);

    auto const toolResult = fixture.llmHttp.body(1)["messages"][2]["content"][0];
    CHECK(toolResult["content"] == "Tool teleport not found in any server");
    CHECK(toolResult["is_error"] == true);
}

TEST_CASE("Orchestrator reports backend failures to the LLM", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.backendHttp.setHandler([](const HttpRequest&) -> Result<HttpResponse> {
        return HttpResponse { .status = 500, .body = "station offline" };
    });
    fixture.llmHttp.enqueue(reply({ toolUseBlock("tu_1", "forecast", nlohmann::json::object()) }));
    fixture.llmHttp.enqueue(reply({ textBlock("The weather service is down.") }));
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator.processMessage("Weather?");
    REQUIRE(result.has_value());
    CHECK(*result == "The weather service is down.");

    auto const toolResult = fixture.llmHttp.body(1)["messages"][2]["content"][0];
    CHECK(toolResult["content"]
          == "Error calling weather:forecast: HTTP 500 from http://weather.local/forecast: station offline");
    CHECK(toolResult["is_error"] == true);
}

TEST_CASE("Orchestrator runs several tool calls of one reply", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.llmHttp.enqueue(reply({
        toolUseBlock("tu_1", "forecast", { { "city", "Oslo" } }),
        toolUseBlock("tu_2", "forecast", { { "city", "Rome" } }),
    }));
    fixture.llmHttp.enqueue(reply({ textBlock("Rain in both.") }));
    auto orchestrator = fixture.orchestrator();

    REQUIRE(orchestrator.processMessage("Oslo and Rome?").has_value());
    CHECK(fixture.backendHttp.requestCount() == 2);

    auto const results = fixture.llmHttp.body(1)["messages"][2]["content"];
    REQUIRE(results.size() == 2);
    CHECK(results[0]["tool_use_id"] == "tu_1");
    CHECK(results[0]["content"].get<std::string>().ends_with("city=Oslo"));
    CHECK(results[1]["tool_use_id"] == "tu_2");
    CHECK(results[1]["content"].get<std::string>().ends_with("city=Rome"));
}

TEST_CASE("Orchestrator asks for a final answer after the step limit", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.llmHttp.enqueue(reply({ toolUseBlock("tu_1", "forecast", nlohmann::json::object()) }));
    fixture.llmHttp.enqueue(reply({ toolUseBlock("tu_2", "forecast", nlohmann::json::object()) }));
    fixture.llmHttp.enqueue(reply({ textBlock("Summary.") }));
    auto orchestrator = fixture.orchestrator(OrchestratorConfig { .maxToolSteps = 2 });

    auto result = orchestrator.processMessage("Keep checking");
    REQUIRE(result.has_value());
    CHECK(*result == "Summary.");

    REQUIRE(fixture.llmHttp.requestCount() == 3);
    CHECK(fixture.llmHttp.body(0).contains("tools"));
    CHECK(fixture.llmHttp.body(1).contains("tools"));
    CHECK(!fixture.llmHttp.body(2).contains("tools"));
    CHECK(fixture.llmHttp.body(2)["messages"].size() == 5);
    CHECK(fixture.backendHttp.requestCount() == 2);
}

TEST_CASE("Orchestrator substitutes a fallback for an empty reply", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.llmHttp.enqueue(reply({}));
    auto orchestrator = fixture.orchestrator();

    auto result = orchestrator.processMessage("Hmm");
    REQUIRE(result.has_value());
    CHECK(*result == EmptyReplyText);
    CHECK(fixture.conversation.turns()[1].text == EmptyReplyText);
}

TEST_CASE("Orchestrator leaves the conversation unchanged when the LLM fails", "[orchestrator]")
{
    auto fixture = Fixture();
    fixture.llmHttp.enqueue(reply({ textBlock("First answer") }));
    fixture.llmHttp.enqueue(HttpResponse { .status = 500, .body = "overloaded" });
    auto orchestrator = fixture.orchestrator();

    REQUIRE(orchestrator.processMessage("First").has_value());
    auto failed = orchestrator.processMessage("Second");
    REQUIRE(!failed.has_value());
    CHECK(failed.error().code == ErrorCode::RemoteError);
    CHECK(failed.error().message == "API Error 500: overloaded");
    CHECK(fixture.conversation.size() == 2);
}

TEST_CASE("Orchestrator sends only the configured history window", "[orchestrator]")
{
    auto fixture = Fixture();
    for (auto i = 0; i < 3; ++i)
        fixture.conversation.addExchange(std::format("q{}", i), std::format("a{}", i));
    auto orchestrator = fixture.orchestrator(OrchestratorConfig { .historyWindow = 2 });

    REQUIRE(orchestrator.processMessage("now").has_value());

    auto const messages = fixture.llmHttp.body(0)["messages"];
    REQUIRE(messages.size() == 3);
    CHECK(messages[0]["content"] == "q2");
    CHECK(messages[1]["content"] == "a2");
    CHECK(messages[2]["content"] == "now");
}

TEST_CASE("Orchestrator uses a configured system prompt", "[orchestrator]")
{
    auto fixture = Fixture();
    auto orchestrator = fixture.orchestrator(OrchestratorConfig { .systemPrompt = "Answer in French." });

    CHECK(orchestrator.systemPrompt() == "Answer in French.");
    REQUIRE(orchestrator.processMessage("Hi").has_value());
    CHECK(fixture.llmHttp.body(0)["system"] == "Answer in French.");
}
