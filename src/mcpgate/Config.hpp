// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>
#include <gateway/ServerManager.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpgate
{

/// @brief Gateway settings plus the server definitions they select.
struct GatewayConfig
{
    /// @brief Path of the server definition file.
    std::string configPath;

    std::string host = "127.0.0.1";
    int port = 8085;

    /// @brief Auto-enable policy: `*` for every server, or ids in start order.
    std::vector<std::string> autoEnable;

    log::Level logLevel = log::Level::Info;

    ServerManagerOptions serverOptions;
    std::chrono::milliseconds sessionIdleTimeout { std::chrono::minutes(30) };

    /// @brief Loaded by loadServers(); `enabled` reflects the auto-enable policy.
    std::vector<ServerDefinition> servers;

    /// @brief Auto-enabled server ids in start order, filled by loadServers().
    std::vector<std::string> startOrder;
};

/// @brief Environment lookup, injectable for tests.
using EnvironmentLookup = std::function<const char*(const char*)>;

/// @brief Returns the default server definition file path:
/// $XDG_CONFIG_HOME/mcp/mcp_servers.json or ~/.config/mcp/mcp_servers.json.
[[nodiscard]] auto defaultServersPath() -> std::string;

/// @brief Checks a server id: non-empty, `[A-Za-z0-9_.-]`, no `__`, no trailing `_`.
[[nodiscard]] auto validateServerId(std::string_view id) -> VoidResult;

/// @brief Parses the `mcpServers` object of a server definition document.
/// @return The definitions sorted by id, or ConfigError naming the offending entry.
[[nodiscard]] auto parseServerDefinitions(const nlohmann::json& root) -> Result<std::vector<ServerDefinition>>;

/// @brief Reads and parses a server definition file.
[[nodiscard]] auto loadServerDefinitions(std::string_view path) -> Result<std::vector<ServerDefinition>>;

/// @brief Splits a comma separated auto-enable list, dropping blanks.
[[nodiscard]] auto parseAutoEnableList(std::string_view text) -> std::vector<std::string>;

/// @brief Evaluates the auto-enable policy against the defined servers.
///
/// Ids that are not defined are logged and skipped; duplicates are dropped.
/// @return The ids to start, in policy order (definition order for `*`).
[[nodiscard]] auto resolveAutoEnable(const std::vector<std::string>& policy,
                                     const std::vector<ServerDefinition>& servers) -> std::vector<std::string>;

/// @brief Applies MCP_GATEWAY_* environment variables on top of the current settings.
[[nodiscard]] auto applyEnvironment(GatewayConfig& config, const EnvironmentLookup& getenv) -> VoidResult;

/// @brief Loads the server definitions named by the settings and marks the auto-enabled ones.
///
/// A missing file at the default path yields no servers; a missing explicit file is an error.
[[nodiscard]] auto loadServers(GatewayConfig& config, bool pathIsExplicit) -> VoidResult;

} // namespace mcpgate
