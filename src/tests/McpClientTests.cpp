// SPDX-License-Identifier: Apache-2.0
#include <mcp/McpClient.hpp>

#include <tests/MockTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace mcpgate;
using namespace std::chrono_literals;

TEST_CASE("McpClient initialize handshake", "[mcp]")
{
    auto transport = test::MockTransport();
    transport.onSend = [&transport](const nlohmann::json& message) {
        if (message.value("method", "") != "initialize")
            return;
        transport.push(jsonrpc::makeResult(
            message["id"],
            {
                { "protocolVersion", "2025-06-18" },
                { "serverInfo", { { "name", "test-server" }, { "version", "1.0" } } },
                { "capabilities", { { "tools", { { "listChanged", true } } } } },
            }));
    };

    auto correlator = RpcCorrelator("test", transport);
    correlator.start({}, {});
    auto client = McpClient(correlator);

    auto result = client.initialize(5s);

    REQUIRE(result.has_value());
    CHECK(result->serverName == "test-server");
    CHECK(result->serverVersion == "1.0");
    CHECK(result->protocolVersion == "2025-06-18");
    CHECK(result->hasTools);
    CHECK(result->toolsListChanged);
    CHECK(!result->hasResources);
    CHECK(client.isInitialized());

    auto const sent = transport.sent();
    REQUIRE(sent.size() == 2);
    CHECK(sent[0]["method"] == "initialize");
    CHECK(sent[0]["params"]["protocolVersion"] == McpProtocolVersion);
    CHECK(sent[0]["params"]["clientInfo"]["name"] == "mcpgate");
    CHECK(sent[1]["method"] == "notifications/initialized");
    CHECK(!sent[1].contains("id"));
}

TEST_CASE("McpClient initialize fails on a backend error", "[mcp]")
{
    auto transport = test::MockTransport();
    transport.onSend = [&transport](const nlohmann::json& message) {
        if (message.contains("id"))
            transport.push(jsonrpc::makeErrorResponse(message["id"], -32603, "not today"));
    };

    auto correlator = RpcCorrelator("test", transport);
    correlator.start({}, {});
    auto client = McpClient(correlator);

    auto result = client.initialize(5s);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::UpstreamError);
    CHECK(!client.isInitialized());
}

TEST_CASE("McpClient requires initialization before listing or calling tools", "[mcp]")
{
    auto transport = test::MockTransport();
    auto correlator = RpcCorrelator("test", transport);
    auto client = McpClient(correlator);

    auto tools = client.listTools(1s);
    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::InvalidRequest);

    auto call = client.callTool("echo", nlohmann::json::object(), 1s);
    REQUIRE(!call.has_value());
    CHECK(call.error().code == ErrorCode::InvalidRequest);
    CHECK(transport.sent().empty());
}

TEST_CASE("McpClient listTools", "[mcp]")
{
    auto transport = test::MockTransport();
    test::respondAsToolServer(transport, { "read_file", "write_file" });

    auto correlator = RpcCorrelator("test", transport);
    correlator.start({}, {});
    auto client = McpClient(correlator);
    REQUIRE(client.initialize(5s).has_value());

    auto tools = client.listTools(5s);
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 2);
    CHECK((*tools)[0].name == "read_file");
    CHECK((*tools)[0].description == "Mock tool read_file");
    CHECK((*tools)[0].inputSchema["type"] == "object");
    CHECK((*tools)[1].name == "write_file");
}

TEST_CASE("McpClient callTool relays the raw result", "[mcp]")
{
    auto transport = test::MockTransport();
    test::respondAsToolServer(transport, { "echo" }, [](const nlohmann::json& request) -> nlohmann::json {
        return {
            { "content", { { { "type", "text" }, { "text", request["params"]["arguments"]["text"] } } } },
            { "isError", false },
        };
    });

    auto correlator = RpcCorrelator("test", transport);
    correlator.start({}, {});
    auto client = McpClient(correlator);
    REQUIRE(client.initialize(5s).has_value());

    auto result = client.callTool("echo", { { "text", "hello" } }, 5s);
    REQUIRE(result.has_value());
    CHECK((*result)["content"][0]["text"] == "hello");
    CHECK((*result)["isError"] == false);

    auto const sent = transport.sent();
    auto const& request = sent.back();
    CHECK(request["method"] == "tools/call");
    CHECK(request["params"]["name"] == "echo");
}

TEST_CASE("McpClient callTool sends an empty object for null arguments", "[mcp]")
{
    auto transport = test::MockTransport();
    test::respondAsToolServer(transport, { "status" }, [](const nlohmann::json&) -> nlohmann::json {
        return { { "content", nlohmann::json::array() } };
    });

    auto correlator = RpcCorrelator("test", transport);
    correlator.start({}, {});
    auto client = McpClient(correlator);
    REQUIRE(client.initialize(5s).has_value());

    REQUIRE(client.callTool("status", nullptr, 5s).has_value());
    CHECK(transport.sent().back()["params"]["arguments"] == nlohmann::json::object());
}

TEST_CASE("parseToolList skips unnamed entries and defaults the schema", "[mcp]")
{
    auto const result = nlohmann::json {
        { "tools",
          {
              { { "name", "search" }, { "description", "Search files" } },
              { { "description", "no name" } },
              { { "name", 42 } },
          } },
    };

    auto tools = parseToolList(result);
    REQUIRE(tools.has_value());
    REQUIRE(tools->size() == 1);
    CHECK((*tools)[0].name == "search");
    CHECK((*tools)[0].inputSchema == nlohmann::json { { "type", "object" } });
}

TEST_CASE("parseToolList rejects a result without a tools array", "[mcp]")
{
    auto tools = parseToolList(nlohmann::json { { "tools", "nope" } });
    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::MalformedUpstreamMessage);
}
