// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace mcpgate
{

McpClient::McpClient(RpcCorrelator& correlator): _correlator(correlator)
{
}

auto McpClient::initialize(std::chrono::milliseconds timeout) -> Result<McpServerCapabilities>
{
    auto params = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities", nlohmann::json::object() },
        { "clientInfo",
          nlohmann::json {
              { "name", "mcpgate" },
              { "version", "0.1.0" },
          } },
    };

    return _correlator.call("initialize", std::move(params), timeout)
        .and_then([this](const nlohmann::json& result) -> Result<McpServerCapabilities> {
            if (!result.is_object())
                return makeError(ErrorCode::MalformedUpstreamMessage, "initialize result is not an object");

            _capabilities.protocolVersion = json::getStringOr(result, "protocolVersion", "");
            _capabilities.serverName =
                json::getStringOr(result.value("serverInfo", nlohmann::json {}), "name", "unknown");
            _capabilities.serverVersion =
                json::getStringOr(result.value("serverInfo", nlohmann::json {}), "version", "unknown");

            if (result.contains("capabilities") && result["capabilities"].is_object())
            {
                auto const& caps = result["capabilities"];
                _capabilities.hasTools = caps.contains("tools");
                _capabilities.hasResources = caps.contains("resources");
                _capabilities.hasPrompts = caps.contains("prompts");
                _capabilities.toolsListChanged =
                    _capabilities.hasTools && json::getBoolOr(caps["tools"], "listChanged", false);
            }

            if (auto notified = _correlator.notify("notifications/initialized"); !notified)
                return std::unexpected(notified.error());

            _initialized = true;
            log::info("[{}] initialized: {} v{} (protocol {})",
                      _correlator.backendId(),
                      _capabilities.serverName,
                      _capabilities.serverVersion,
                      _capabilities.protocolVersion);

            return _capabilities;
        });
}

auto McpClient::listTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>
{
    if (!_initialized)
        return makeError(ErrorCode::InvalidRequest, "Client not initialized");

    return _correlator.call("tools/list", nlohmann::json::object(), timeout).and_then(parseToolList);
}

auto McpClient::startToolCall(std::string_view name,
                              const nlohmann::json& arguments,
                              std::chrono::milliseconds timeout) -> Result<CallHandle>
{
    if (!_initialized)
        return makeError(ErrorCode::InvalidRequest, "Client not initialized");

    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments.is_null() ? nlohmann::json::object() : arguments },
    };

    return _correlator.sendRequest("tools/call", std::move(params), timeout);
}

auto McpClient::callTool(std::string_view name, const nlohmann::json& arguments, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    return startToolCall(name, arguments, timeout).and_then([](CallHandle handle) { return handle.wait(); });
}

auto McpClient::capabilities() const -> const McpServerCapabilities&
{
    return _capabilities;
}

auto McpClient::isInitialized() const -> bool
{
    return _initialized;
}

auto parseToolList(const nlohmann::json& result) -> Result<std::vector<ToolDefinition>>
{
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
        return makeError(ErrorCode::MalformedUpstreamMessage, "tools/list result has no tools array");

    auto tools = std::vector<ToolDefinition> {};
    for (const auto& toolJson: result["tools"])
    {
        if (!toolJson.is_object() || !toolJson.contains("name") || !toolJson["name"].is_string())
        {
            log::warning("Skipping tool entry without a name: {}", toolJson.dump());
            continue;
        }

        auto tool = ToolDefinition {
            .name = toolJson["name"].get<std::string>(),
            .description = json::getStringOr(toolJson, "description", ""),
            .inputSchema = toolJson.contains("inputSchema") && toolJson["inputSchema"].is_object()
                               ? toolJson["inputSchema"]
                               : nlohmann::json { { "type", "object" } },
        };
        tools.push_back(std::move(tool));
    }

    return tools;
}

} // namespace mcpgate
