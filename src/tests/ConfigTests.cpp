// SPDX-License-Identifier: Apache-2.0
#include <mcpgate/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <map>

using namespace mcpgate;

namespace
{

auto writeTempFile(std::string const& name, std::string_view contents) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << contents;
    return path;
}

auto lookupIn(std::map<std::string, std::string> const& variables) -> EnvironmentLookup
{
    return [&variables](const char* name) -> const char* {
        auto const it = variables.find(name);
        return it != variables.end() ? it->second.c_str() : nullptr;
    };
}

auto definitions(std::initializer_list<std::string> ids) -> std::vector<ServerDefinition>
{
    auto servers = std::vector<ServerDefinition> {};
    for (const auto& id: ids)
        servers.push_back({ .id = id, .command = "true" });
    return servers;
}

} // namespace

TEST_CASE("GatewayConfig has expected defaults", "[config]")
{
    auto const config = GatewayConfig {};
    CHECK(config.host == "127.0.0.1");
    CHECK(config.port == 8085);
    CHECK(config.autoEnable.empty());
    CHECK(config.logLevel == log::Level::Info);
    CHECK(config.servers.empty());
}

TEST_CASE("defaultServersPath ends with mcp_servers.json", "[config]")
{
    CHECK(defaultServersPath().ends_with("mcp_servers.json"));
}

TEST_CASE("validateServerId", "[config]")
{
    CHECK(validateServerId("git").has_value());
    CHECK(validateServerId("my-server.v2").has_value());
    CHECK(validateServerId("snake_case").has_value());

    for (auto const* id: { "", "a__b", "git_", "bad id", "slash/id" })
    {
        auto const result = validateServerId(id);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("parseServerDefinitions reads command, args, env and passwordCommand", "[config]")
{
    auto const root = nlohmann::json::parse(R"({
        "mcpServers": {
            "git": {
                "command": "mcp-server-git",
                "args": ["--repository", "/src"],
                "env": {"GIT_PAGER": "cat"},
                "passwordCommand": {"GITHUB_TOKEN": ["pass", "show", "github"]}
            },
            "fs": {"command": "mcp-server-fs"}
        }
    })");

    auto result = parseServerDefinitions(root);
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);

    auto const& fs = result->at(0);
    CHECK(fs.id == "fs");
    CHECK(fs.command == "mcp-server-fs");
    CHECK(fs.args.empty());
    CHECK(fs.secretCommands.empty());
    CHECK(!fs.enabled);

    auto const& git = result->at(1);
    CHECK(git.id == "git");
    CHECK(git.command == "mcp-server-git");
    CHECK(git.args == std::vector<std::string> { "--repository", "/src" });
    CHECK(git.env.at("GIT_PAGER") == "cat");
    CHECK(git.secretCommands.at("GITHUB_TOKEN") == std::vector<std::string> { "pass", "show", "github" });
}

TEST_CASE("parseServerDefinitions without mcpServers yields no servers", "[config]")
{
    auto result = parseServerDefinitions(nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(result->empty());
}

TEST_CASE("parseServerDefinitions rejects invalid entries", "[config]")
{
    SECTION("missing command")
    {
        auto result = parseServerDefinitions(nlohmann::json::parse(R"({"mcpServers": {"git": {"args": []}}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.contains("git"));
        CHECK(result.error().message.contains("missing command"));
    }

    SECTION("passwordCommand with a non-string argument")
    {
        auto result = parseServerDefinitions(nlohmann::json::parse(
            R"({"mcpServers": {"git": {"command": "x", "passwordCommand": {"TOKEN": ["pass", 1]}}}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.contains("TOKEN"));
    }

    SECTION("passwordCommand with an empty command")
    {
        auto result = parseServerDefinitions(
            nlohmann::json::parse(R"({"mcpServers": {"git": {"command": "x", "passwordCommand": {"TOKEN": []}}}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("invalid server id")
    {
        auto result = parseServerDefinitions(nlohmann::json::parse(R"({"mcpServers": {"a__b": {"command": "x"}}})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    SECTION("mcpServers is not an object")
    {
        auto result = parseServerDefinitions(nlohmann::json::parse(R"({"mcpServers": []})"));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("loadServerDefinitions reads a file", "[config]")
{
    auto const path = writeTempFile("mcpgate_test_servers.json", R"({
        "mcpServers": {"echo": {"command": "cat"}}
    })");

    auto result = loadServerDefinitions(path.string());
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    CHECK(result->front().id == "echo");

    std::filesystem::remove(path);
}

TEST_CASE("loadServerDefinitions reports unreadable and malformed files", "[config]")
{
    auto missing = loadServerDefinitions("/nonexistent/mcp_servers.json");
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::ConfigError);

    auto const path = writeTempFile("mcpgate_test_malformed.json", "{ not json");
    auto malformed = loadServerDefinitions(path.string());
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().code == ErrorCode::ConfigError);
    std::filesystem::remove(path);
}

TEST_CASE("parseAutoEnableList splits and trims", "[config]")
{
    CHECK(parseAutoEnableList("a, ,b") == std::vector<std::string> { "a", "b" });
    CHECK(parseAutoEnableList(" git ,fs") == std::vector<std::string> { "git", "fs" });
    CHECK(parseAutoEnableList("").empty());
    CHECK(parseAutoEnableList("*") == std::vector<std::string> { "*" });
}

TEST_CASE("resolveAutoEnable", "[config]")
{
    auto const servers = definitions({ "fs", "git", "web" });

    SECTION("wildcard enables every server in definition order")
    {
        CHECK(resolveAutoEnable({ "*" }, servers) == std::vector<std::string> { "fs", "git", "web" });
    }

    SECTION("explicit ids keep policy order")
    {
        CHECK(resolveAutoEnable({ "web", "fs" }, servers) == std::vector<std::string> { "web", "fs" });
    }

    SECTION("duplicates and unknown ids are dropped")
    {
        CHECK(resolveAutoEnable({ "git", "nope", "git" }, servers) == std::vector<std::string> { "git" });
    }

    SECTION("empty policy enables nothing")
    {
        CHECK(resolveAutoEnable({}, servers).empty());
    }
}

TEST_CASE("applyEnvironment overrides settings", "[config]")
{
    auto const variables = std::map<std::string, std::string> {
        { "MCP_GATEWAY_CONFIG", "/etc/mcp/servers.json" },
        { "MCP_GATEWAY_HOST", "0.0.0.0" },
        { "MCP_GATEWAY_PORT", "9000" },
        { "MCP_GATEWAY_AUTO_ENABLE", "git,fs" },
        { "MCP_GATEWAY_LOG_LEVEL", "DEBUG" },
    };

    auto config = GatewayConfig {};
    REQUIRE(applyEnvironment(config, lookupIn(variables)).has_value());
    CHECK(config.configPath == "/etc/mcp/servers.json");
    CHECK(config.host == "0.0.0.0");
    CHECK(config.port == 9000);
    CHECK(config.autoEnable == std::vector<std::string> { "git", "fs" });
    CHECK(config.logLevel == log::Level::Debug);
}

TEST_CASE("applyEnvironment keeps defaults when nothing is set", "[config]")
{
    auto const variables = std::map<std::string, std::string> {};
    auto config = GatewayConfig {};
    REQUIRE(applyEnvironment(config, lookupIn(variables)).has_value());
    CHECK(config.host == "127.0.0.1");
    CHECK(config.port == 8085);
}

TEST_CASE("applyEnvironment rejects bad values", "[config]")
{
    auto config = GatewayConfig {};

    auto const notANumber = std::map<std::string, std::string> { { "MCP_GATEWAY_PORT", "http" } };
    auto result = applyEnvironment(config, lookupIn(notANumber));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
    CHECK(result.error().message.contains("must be an integer"));

    auto const outOfRange = std::map<std::string, std::string> { { "MCP_GATEWAY_PORT", "70000" } };
    result = applyEnvironment(config, lookupIn(outOfRange));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    auto const badLevel = std::map<std::string, std::string> { { "MCP_GATEWAY_LOG_LEVEL", "loud" } };
    result = applyEnvironment(config, lookupIn(badLevel));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadServers marks auto-enabled servers", "[config]")
{
    auto const path = writeTempFile("mcpgate_test_load_servers.json", R"({
        "mcpServers": {
            "fs": {"command": "cat"},
            "git": {"command": "cat"},
            "web": {"command": "cat"}
        }
    })");

    auto config = GatewayConfig {};
    config.configPath = path.string();
    config.autoEnable = { "web", "fs" };

    REQUIRE(loadServers(config, true).has_value());
    REQUIRE(config.servers.size() == 3);
    CHECK(config.startOrder == std::vector<std::string> { "web", "fs" });
    for (const auto& server: config.servers)
        CHECK(server.enabled == (server.id != "git"));

    std::filesystem::remove(path);
}

TEST_CASE("loadServers requires an explicitly named file to exist", "[config]")
{
    auto config = GatewayConfig {};
    config.configPath = "/nonexistent/mcpgate/servers.json";

    auto result = loadServers(config, true);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadServers tolerates a missing default file", "[config]")
{
    auto config = GatewayConfig {};
    config.configPath = "/nonexistent/mcpgate/servers.json";

    REQUIRE(loadServers(config, false).has_value());
    CHECK(config.servers.empty());
    CHECK(config.startOrder.empty());
}
