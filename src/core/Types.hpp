// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpgate
{

/// @brief Separator between a server id and a tool's local name in namespaced tool names.
constexpr auto NamespaceSeparator = std::string_view { "__" };

/// @brief Static definition of one backend tool server, as read from configuration.
struct ServerDefinition
{
    std::string id;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief Environment variable name -> command (argv) whose trimmed stdout becomes its value.
    std::map<std::string, std::vector<std::string>> secretCommands;

    bool enabled = false;
};

/// @brief Lifecycle state of a running backend.
enum class BackendState
{
    Starting,
    Ready,
    Degraded,
    Stopped,
};

/// @brief Converts a BackendState to its string representation.
[[nodiscard]] constexpr auto backendStateToString(BackendState state) -> std::string_view
{
    switch (state)
    {
        case BackendState::Starting: return "starting";
        case BackendState::Ready: return "ready";
        case BackendState::Degraded: return "degraded";
        case BackendState::Stopped: return "stopped";
    }
    return "unknown";
}

/// @brief A tool as reported by a backend's tools/list.
struct ToolDefinition
{
    std::string name;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief A tool in the aggregate catalog, qualified by its owning backend.
struct Tool
{
    std::string serverId;
    std::string localName;
    std::string namespacedName;
    std::string description;
    nlohmann::json inputSchema;
};

/// @brief Builds the namespaced name `server_id__local_name`.
[[nodiscard]] inline auto makeNamespacedName(std::string_view serverId, std::string_view localName)
    -> std::string
{
    auto name = std::string(serverId);
    name += NamespaceSeparator;
    name += localName;
    return name;
}

/// @brief Splits a namespaced name at the first separator.
///
/// Server ids never contain the separator (enforced by configuration validation),
/// so the first occurrence is always the boundary.
/// @return (server id, local name), or std::nullopt if there is no separator or either part is empty.
[[nodiscard]] inline auto splitNamespacedName(std::string_view name)
    -> std::optional<std::pair<std::string, std::string>>
{
    auto const pos = name.find(NamespaceSeparator);
    if (pos == std::string_view::npos || pos == 0 || pos + NamespaceSeparator.size() >= name.size())
        return std::nullopt;

    return std::pair { std::string(name.substr(0, pos)),
                       std::string(name.substr(pos + NamespaceSeparator.size())) };
}

} // namespace mcpgate
