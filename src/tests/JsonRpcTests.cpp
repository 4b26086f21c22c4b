// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpgate;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("makeErrorResponse omits data unless given", "[jsonrpc]")
{
    auto plain = jsonrpc::makeErrorResponse(7, jsonrpc::codes::MethodNotFound, "Method not found: x");
    CHECK(plain["id"] == 7);
    CHECK(plain["error"]["code"] == -32601);
    CHECK(plain["error"]["message"] == "Method not found: x");
    CHECK(!plain["error"].contains("data"));

    auto withData =
        jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, "Parse error", { { "kind", "InvalidRequest" } });
    CHECK(withData["id"].is_null());
    CHECK(withData["error"]["data"]["kind"] == "InvalidRequest");
}

TEST_CASE("parseMessage classifies a success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    CHECK(result->kind == jsonrpc::MessageKind::Response);
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseMessage classifies an error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    CHECK(result->kind == jsonrpc::MessageKind::Response);
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseMessage distinguishes requests from notifications", "[jsonrpc]")
{
    auto request = jsonrpc::parseMessage(jsonrpc::makeRequest(3, "ping"));
    REQUIRE(request.has_value());
    CHECK(request->kind == jsonrpc::MessageKind::Request);
    CHECK(request->method == "ping");
    CHECK(request->id == 3);

    auto notification = jsonrpc::parseMessage(jsonrpc::makeNotification("notifications/tools/list_changed"));
    REQUIRE(notification.has_value());
    CHECK(notification->kind == jsonrpc::MessageKind::Notification);

    auto nullId = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", nullptr }, { "method", "x" } });
    REQUIRE(nullId.has_value());
    CHECK(nullId->kind == jsonrpc::MessageKind::Notification);
}

TEST_CASE("parseMessage accepts string ids", "[jsonrpc]")
{
    auto result = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", "abc" }, { "method", "tools/list" } });
    REQUIRE(result.has_value());
    CHECK(result->id == "abc");
}

TEST_CASE("parseMessage rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto result = jsonrpc::parseMessage(nlohmann::json { { "version", "1.0" } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::MalformedUpstreamMessage);

    auto array = jsonrpc::parseMessage(nlohmann::json::array({ jsonrpc::makeRequest(1, "ping") }));
    REQUIRE(!array.has_value());
    CHECK(array.error().code == ErrorCode::MalformedUpstreamMessage);
}

TEST_CASE("parseMessage rejects invalid id and method types", "[jsonrpc]")
{
    auto badId = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", 1.5 }, { "result", 1 } });
    REQUIRE(!badId.has_value());
    CHECK(badId.error().code == ErrorCode::MalformedUpstreamMessage);

    auto badMethod = jsonrpc::parseMessage({ { "jsonrpc", "2.0" }, { "id", 1 }, { "method", 5 } });
    REQUIRE(!badMethod.has_value());
    CHECK(badMethod.error().code == ErrorCode::MalformedUpstreamMessage);
}

TEST_CASE("parseMessage rejects a response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::MalformedUpstreamMessage);
}
