// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpmux;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    REQUIRE(request.contains("params"));
    CHECK(request["params"] == nlohmann::json::object());
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["id"] == 42);
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("test/notify");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(!notif.contains("params"));
    CHECK(notif["method"] == "test/notify");
}

TEST_CASE("messageId accepts integer and numeric string ids", "[jsonrpc]")
{
    CHECK(jsonrpc::messageId(nlohmann::json { { "id", 7 } }) == 7);
    CHECK(jsonrpc::messageId(nlohmann::json { { "id", "12" } }) == 12);
    CHECK(!jsonrpc::messageId(nlohmann::json { { "id", "abc" } }).has_value());
    CHECK(!jsonrpc::messageId(nlohmann::json { { "method", "x" } }).has_value());
    CHECK(!jsonrpc::messageId(nlohmann::json::array()).has_value());
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = jsonrpc::makeResult(1, { { "status", "ok" } });

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->id == 1);
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = jsonrpc::makeErrorResponse(1, -32600, "Invalid Request");

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse keeps a non-object error as text", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "jsonrpc", "2.0" }, { "id", 3 }, { "error", "went wrong" } };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    REQUIRE(result->error.has_value());
    CHECK(result->error->message == "\"went wrong\"");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("resultOf turns JSON-RPC errors into RemoteError", "[jsonrpc]")
{
    auto response = jsonrpc::parseResponse(jsonrpc::makeErrorResponse(5, -32000, "boom"));
    REQUIRE(response.has_value());

    auto result = jsonrpc::resultOf(*response);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::RemoteError);
    CHECK(result.error().message == "RPC error -32000: boom");
}

TEST_CASE("resultOf returns the result member", "[jsonrpc]")
{
    auto response = jsonrpc::parseResponse(jsonrpc::makeResult(5, "done"));
    REQUIRE(response.has_value());

    auto result = jsonrpc::resultOf(*response);
    REQUIRE(result.has_value());
    CHECK(*result == "done");
}
