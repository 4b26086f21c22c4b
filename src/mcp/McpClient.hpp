// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/RpcCorrelator.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Protocol version the gateway speaks to backends and to its own clients.
constexpr auto McpProtocolVersion = std::string_view { "2025-06-18" };

/// @brief Backend capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    bool toolsListChanged = false;
    std::string protocolVersion;
    std::string serverName;
    std::string serverVersion;
};

/// @brief Client side of the tool protocol, spoken to one backend.
///
/// Handles the lifecycle: initialize, list tools, call tools. All requests go through
/// the backend's RpcCorrelator, so concurrent calls are safe.
class McpClient
{
  public:
    /// @brief Constructs an McpClient over the given correlator.
    /// @param correlator The correlator to send requests through; must outlive the client.
    explicit McpClient(RpcCorrelator& correlator);

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Performs the initialize handshake and sends notifications/initialized.
    /// @param timeout Deadline for the initialize request.
    /// @return The backend's capabilities or an error.
    [[nodiscard]] auto initialize(std::chrono::milliseconds timeout) -> Result<McpServerCapabilities>;

    /// @brief Lists the tools the backend offers.
    /// @param timeout Deadline for the request.
    /// @return A vector of tool definitions or an error.
    [[nodiscard]] auto listTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>;

    /// @brief Starts a tools/call request without waiting for it.
    /// @param name The backend-local tool name.
    /// @param arguments The tool arguments.
    /// @param timeout Deadline for the request.
    /// @return A handle to wait on or cancel.
    [[nodiscard]] auto startToolCall(std::string_view name,
                                     const nlohmann::json& arguments,
                                     std::chrono::milliseconds timeout) -> Result<CallHandle>;

    /// @brief Calls a tool and waits for its raw result object.
    [[nodiscard]] auto callTool(std::string_view name,
                                const nlohmann::json& arguments,
                                std::chrono::milliseconds timeout) -> Result<nlohmann::json>;

    /// @brief Returns the backend capabilities (valid after initialize).
    [[nodiscard]] auto capabilities() const -> const McpServerCapabilities&;

    /// @brief Returns true if the client has been initialized.
    [[nodiscard]] auto isInitialized() const -> bool;

  private:
    RpcCorrelator& _correlator;
    McpServerCapabilities _capabilities;
    bool _initialized = false;
};

/// @brief Parses the result object of a tools/list response.
/// @return The tools; entries without a string name are skipped.
[[nodiscard]] auto parseToolList(const nlohmann::json& result) -> Result<std::vector<ToolDefinition>>;

} // namespace mcpgate
