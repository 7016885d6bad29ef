// SPDX-License-Identifier: Apache-2.0
#include <llm/LlmClient.hpp>

#include "support/ScriptedLlm.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace mcpmux;
using namespace std::chrono_literals;
using test::ScriptedLlm;

namespace
{

auto testConfig() -> LlmClientConfig
{
    auto config = LlmClientConfig {};
    config.endpoint = "http://llm.local/v1/messages";
    config.apiKey = "sk-test";
    config.model = "claude-test";
    config.maxTokens = 123;
    config.timeout = 7s;
    return config;
}

auto sampleTools() -> std::vector<ToolDescriptor>
{
    return {
        ToolDescriptor {
            .name = "forecast",
            .description = "Weather forecast",
            .inputSchema = { { "type", "object" } },
            .owningServer = "weather",
        },
    };
}

} // namespace

TEST_CASE("LlmClient sends the Messages API request", "[llm]")
{
    auto http = ScriptedLlm();
    http.enqueue(test::llmResponse(nlohmann::json::array({ test::textBlock("Hello") })));
    auto client = LlmClient(testConfig(), http);

    auto const messages = nlohmann::json::array({ { { "role", "user" }, { "content", "Hi" } } });
    auto const tools = sampleTools();
    auto reply = client.send("Be brief", messages, tools);
    REQUIRE(reply.has_value());
    CHECK(reply->text == "Hello");
    CHECK(!reply->hasToolCalls());
    CHECK(reply->stopReason == "end_turn");

    auto const requests = http.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].url == "http://llm.local/v1/messages");
    CHECK(requests[0].timeout == 7s);
    CHECK(ScriptedLlm::header(requests[0], "x-api-key") == "sk-test");
    CHECK(ScriptedLlm::header(requests[0], "anthropic-version") == "2023-06-01");
    CHECK(ScriptedLlm::header(requests[0], "content-type") == "application/json");

    auto const body = http.body(0);
    CHECK(body["model"] == "claude-test");
    CHECK(body["max_tokens"] == 123);
    CHECK(body["system"] == "Be brief");
    CHECK(body["messages"] == messages);
    REQUIRE(body["tools"].size() == 1);
    CHECK(body["tools"][0]["name"] == "forecast");
    CHECK(body["tools"][0]["input_schema"]["type"] == "object");
    CHECK(body["tool_choice"]["type"] == "auto");
}

TEST_CASE("LlmClient omits tools when the catalog is empty", "[llm]")
{
    auto http = ScriptedLlm();
    auto client = LlmClient(testConfig(), http);

    auto const body = client.buildRequestBody("sys", nlohmann::json::array(), {});
    CHECK(!body.contains("tools"));
    CHECK(!body.contains("tool_choice"));
}

TEST_CASE("LlmClient requires an API key", "[llm]")
{
    auto http = ScriptedLlm();
    auto config = testConfig();
    config.apiKey.clear();
    auto client = LlmClient(config, http);

    auto reply = client.send("sys", nlohmann::json::array(), {});
    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::ConfigError);
    CHECK(http.requestCount() == 0);
}

TEST_CASE("LlmClient reports API errors with a bounded body excerpt", "[llm]")
{
    auto http = ScriptedLlm();
    http.enqueue(HttpResponse { .status = 529, .body = std::string(300, 'e') });
    auto client = LlmClient(testConfig(), http);

    auto reply = client.send("sys", nlohmann::json::array(), {});
    REQUIRE(!reply.has_value());
    CHECK(reply.error().code == ErrorCode::RemoteError);
    CHECK(reply.error().message == "API Error 529: " + std::string(200, 'e'));
}

TEST_CASE("LlmClient reports malformed bodies as ProtocolError", "[llm]")
{
    auto http = ScriptedLlm();
    http.enqueue(HttpResponse { .status = 200, .body = "not json" });
    http.enqueue(HttpResponse { .status = 200, .body = R"({"type":"message"})" });
    auto client = LlmClient(testConfig(), http);

    auto first = client.send("sys", nlohmann::json::array(), {});
    REQUIRE(!first.has_value());
    CHECK(first.error().code == ErrorCode::ProtocolError);

    auto second = client.send("sys", nlohmann::json::array(), {});
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::ProtocolError);
    CHECK(second.error().message.starts_with("Unexpected response format"));
}

TEST_CASE("parseLlmReply collects text and tool calls in order", "[llm]")
{
    auto const body = nlohmann::json {
        { "content",
          nlohmann::json::array({
              test::textBlock("Let me check. "),
              test::toolUseBlock("tu_1", "forecast", { { "city", "Paris" } }),
              { { "type", "thinking" }, { "thinking", "..." } },
              test::textBlock("One moment."),
              test::toolUseBlock("tu_2", "radar", nlohmann::json::object()),
          }) },
        { "stop_reason", "tool_use" },
    };

    auto reply = parseLlmReply(body);
    REQUIRE(reply.has_value());
    CHECK(reply->text == "Let me check. One moment.");
    CHECK(reply->stopReason == "tool_use");
    REQUIRE(reply->toolCalls.size() == 2);
    CHECK(reply->toolCalls[0].id == "tu_1");
    CHECK(reply->toolCalls[0].name == "forecast");
    CHECK(reply->toolCalls[0].arguments["city"] == "Paris");
    CHECK(reply->toolCalls[1].name == "radar");
}

TEST_CASE("assistantContent and toolResultContent build message blocks", "[llm]")
{
    auto reply = LlmReply {};
    reply.text = "Checking";
    reply.toolCalls.push_back(ToolCall { .id = "tu_1", .name = "forecast", .arguments = { { "city", "Rome" } } });

    auto const content = assistantContent(reply);
    REQUIRE(content.size() == 2);
    CHECK(content[0] == test::textBlock("Checking"));
    CHECK(content[1] == test::toolUseBlock("tu_1", "forecast", { { "city", "Rome" } }));

    auto const results = std::vector<ToolResult> {
        ToolResult { .callId = "tu_1", .content = "Sunny", .isError = false },
        ToolResult { .callId = "tu_2", .content = "Tool radar not found in any server", .isError = true },
    };
    auto const blocks = toolResultContent(results);
    REQUIRE(blocks.size() == 2);
    CHECK(blocks[0]
          == nlohmann::json { { "type", "tool_result" }, { "tool_use_id", "tu_1" }, { "content", "Sunny" } });
    CHECK(blocks[1]["is_error"] == true);
}
