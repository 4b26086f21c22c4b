// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

namespace mcpgate
{

namespace
{
    auto trim(std::string_view text) -> std::string_view
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    auto isIdCharacter(char ch) -> bool
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '.' || ch == '-';
    }

    auto parseSecretCommands(std::string_view id, const nlohmann::json& server)
        -> Result<std::map<std::string, std::vector<std::string>>>
    {
        auto commands = std::map<std::string, std::vector<std::string>> {};
        if (!server.contains("passwordCommand"))
            return commands;

        auto const& section = server["passwordCommand"];
        if (!section.is_object())
            return makeError(ErrorCode::ConfigError,
                             std::format("Server {}: passwordCommand must be an object", id));

        for (const auto& [variable, command]: section.items())
        {
            auto argv = std::vector<std::string> {};
            if (command.is_array())
            {
                for (const auto& arg: command)
                {
                    if (!arg.is_string())
                        return makeError(
                            ErrorCode::ConfigError,
                            std::format("Server {}: passwordCommand.{} must be an array of strings", id, variable));
                    argv.push_back(arg.get<std::string>());
                }
            }
            if (argv.empty())
                return makeError(ErrorCode::ConfigError,
                                 std::format("Server {}: passwordCommand.{} must name a command", id, variable));
            commands.emplace(variable, std::move(argv));
        }
        return commands;
    }

    auto parseInteger(const char* name, std::string_view text) -> Result<int>
    {
        auto value = 0;
        auto const trimmed = trim(text);
        auto const [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
        if (ec != std::errc {} || ptr != trimmed.data() + trimmed.size())
            return makeError(ErrorCode::ConfigError, std::format("{} must be an integer, got '{}'", name, text));
        return value;
    }
} // namespace

auto defaultServersPath() -> std::string
{
    if (auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME"); xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/mcp/mcp_servers.json";
    if (auto const* const home = std::getenv("HOME"); home && *home)
        return std::string(home) + "/.config/mcp/mcp_servers.json";
    return "mcp_servers.json";
}

auto validateServerId(std::string_view id) -> VoidResult
{
    if (id.empty())
        return makeError(ErrorCode::ConfigError, "Server id must not be empty");
    if (!std::ranges::all_of(id, isIdCharacter))
        return makeError(ErrorCode::ConfigError,
                         std::format("Server id '{}' may only contain letters, digits, '_', '.' and '-'", id));
    if (id.contains(NamespaceSeparator))
        return makeError(ErrorCode::ConfigError,
                         std::format("Server id '{}' must not contain '{}'", id, NamespaceSeparator));
    if (id.back() == '_')
        return makeError(ErrorCode::ConfigError, std::format("Server id '{}' must not end with '_'", id));
    return {};
}

auto parseServerDefinitions(const nlohmann::json& root) -> Result<std::vector<ServerDefinition>>
{
    auto servers = std::vector<ServerDefinition> {};
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Server configuration must be a JSON object");
    if (!root.contains("mcpServers"))
        return servers;
    if (!root["mcpServers"].is_object())
        return makeError(ErrorCode::ConfigError, "mcpServers must be an object");

    for (const auto& [id, serverJson]: root["mcpServers"].items())
    {
        if (auto valid = validateServerId(id); !valid)
            return std::unexpected(valid.error());
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server {}: entry must be an object", id));

        auto definition = ServerDefinition {
            .id = id,
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringArray(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
            .secretCommands = {},
            .enabled = false,
        };
        if (definition.command.empty())
            return makeError(ErrorCode::ConfigError, std::format("Server {}: missing command", id));

        auto secrets = parseSecretCommands(id, serverJson);
        if (!secrets)
            return std::unexpected(secrets.error());
        definition.secretCommands = std::move(*secrets);

        servers.push_back(std::move(definition));
    }

    return servers;
}

auto loadServerDefinitions(std::string_view path) -> Result<std::vector<ServerDefinition>>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open server config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parsed = json::parse(ss.str(), ErrorCode::ConfigError);
    if (!parsed)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parsed.error().message));

    return parseServerDefinitions(*parsed);
}

auto parseAutoEnableList(std::string_view text) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    while (!text.empty())
    {
        auto const comma = text.find(',');
        auto const item = trim(text.substr(0, comma));
        if (!item.empty())
            result.emplace_back(item);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return result;
}

auto resolveAutoEnable(const std::vector<std::string>& policy, const std::vector<ServerDefinition>& servers)
    -> std::vector<std::string>
{
    auto ids = std::vector<std::string> {};

    if (std::ranges::find(policy, "*") != policy.end())
    {
        for (const auto& server: servers)
            ids.push_back(server.id);
        return ids;
    }

    auto seen = std::set<std::string> {};
    for (const auto& id: policy)
    {
        auto const defined = std::ranges::any_of(servers, [&](const ServerDefinition& s) { return s.id == id; });
        if (!defined)
        {
            log::warning("Auto-enable: server {} is not defined, skipping", id);
            continue;
        }
        if (seen.insert(id).second)
            ids.push_back(id);
    }
    return ids;
}

auto applyEnvironment(GatewayConfig& config, const EnvironmentLookup& getenv) -> VoidResult
{
    if (auto const* value = getenv("MCP_GATEWAY_CONFIG"); value && *value)
        config.configPath = value;
    if (auto const* value = getenv("MCP_GATEWAY_HOST"); value && *value)
        config.host = value;
    if (auto const* value = getenv("MCP_GATEWAY_PORT"); value && *value)
    {
        auto port = parseInteger("MCP_GATEWAY_PORT", value);
        if (!port)
            return std::unexpected(port.error());
        if (*port < 0 || *port > 65535)
            return makeError(ErrorCode::ConfigError, std::format("MCP_GATEWAY_PORT out of range: {}", *port));
        config.port = *port;
    }
    if (auto const* value = getenv("MCP_GATEWAY_AUTO_ENABLE"); value && *value)
        config.autoEnable = parseAutoEnableList(value);
    if (auto const* value = getenv("MCP_GATEWAY_LOG_LEVEL"); value && *value)
    {
        auto level = log::levelFromString(value);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown MCP_GATEWAY_LOG_LEVEL '{}'", value));
        config.logLevel = *level;
    }
    return {};
}

auto loadServers(GatewayConfig& config, bool pathIsExplicit) -> VoidResult
{
    if (config.configPath.empty())
        config.configPath = defaultServersPath();

    if (!pathIsExplicit && !std::filesystem::exists(config.configPath))
    {
        log::warning("No server config at {}; starting without servers", config.configPath);
        config.servers.clear();
        config.startOrder.clear();
        return {};
    }

    auto servers = loadServerDefinitions(config.configPath);
    if (!servers)
        return std::unexpected(servers.error());

    config.startOrder = resolveAutoEnable(config.autoEnable, *servers);
    for (auto& server: *servers)
        server.enabled = std::ranges::find(config.startOrder, server.id) != config.startOrder.end();

    config.servers = std::move(*servers);
    log::info("Loaded {} server definition(s) from {}", config.servers.size(), config.configPath);
    return {};
}

} // namespace mcpgate
