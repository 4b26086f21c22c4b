// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <gateway/ServerManager.hpp>
#include <gateway/SessionManager.hpp>
#include <gateway/ToolRegistry.hpp>
#include <http/HttpServer.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mcpgate
{

/// @brief Header carrying the streaming-surface session id.
constexpr auto SessionHeader = std::string_view { "Mcp-Session-Id" };

/// @brief Maps an error kind to the REST surface's HTTP status.
[[nodiscard]] auto httpStatusFor(ErrorCode code) -> int;

/// @brief Maps an error kind to the streaming surface's JSON-RPC error code.
[[nodiscard]] auto rpcErrorCodeFor(ErrorCode code) -> int;

/// @brief REST error body: `{"error": {"kind": ..., "message": ...}}`.
[[nodiscard]] auto makeErrorBody(const Error& error) -> nlohmann::json;

/// @brief Ingress for every HTTP surface of the gateway.
///
/// Handlers are independent of the listener and may be called directly, which is how
/// the tests drive them. Any number of requests may be in flight concurrently.
class Router
{
  public:
    Router(ServerManager& servers, ToolRegistry& registry, SessionManager& sessions);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /// @brief Registers every route on the listener.
    void registerRoutes(http::HttpServer& server);

    /// @brief REST surface: POST /tools/{server}/{tool}.
    ///
    /// The body is the argument object, or `{"arguments": {...}}`; an empty body means `{}`.
    /// Success answers 200 with the backend's raw result.
    [[nodiscard]] auto handleToolCall(std::string_view serverId, std::string_view toolName, std::string_view body)
        -> http::Response;

    /// @brief Streaming surface: POST /mcp with one JSON-RPC envelope.
    [[nodiscard]] auto handleStreamingPost(const http::Request& request) -> http::Response;

    /// @brief Streaming surface: DELETE /mcp closes the session named by the header.
    [[nodiscard]] auto handleStreamingDelete(const http::Request& request) -> http::Response;

    /// @brief Streaming surface: GET /mcp; no server-initiated stream is offered.
    [[nodiscard]] auto handleStreamingGet(const http::Request& request) -> http::Response;

    [[nodiscard]] auto handleOpenApi() -> http::Response;
    [[nodiscard]] auto handleHealth() -> http::Response;

    [[nodiscard]] auto handleListServers() -> http::Response;
    [[nodiscard]] auto handleGetServer(std::string_view serverId) -> http::Response;

    /// @brief PATCH /api/servers/{id} with `{"enabled": bool}`.
    [[nodiscard]] auto handlePatchServer(std::string_view serverId, std::string_view body) -> http::Response;

    /// @brief GET /api/tools, optionally filtered by a case-insensitive substring of the local name.
    [[nodiscard]] auto handleListTools(std::string_view search) -> http::Response;
    [[nodiscard]] auto handleGetTool(std::string_view serverId, std::string_view toolName) -> http::Response;

    /// @brief POST /api/tools/{server}/{tool}: invocation with the `{success, result, error, duration_ms}` form.
    [[nodiscard]] auto handleInvokeTool(std::string_view serverId, std::string_view toolName, std::string_view body)
        -> http::Response;

  private:
    struct StreamingReply
    {
        int status = 200;
        nlohmann::json body;
        std::string sessionId;
    };

    /// @brief Resolves a tool; a configured server that is not serving yields BackendUnavailable.
    [[nodiscard]] auto resolveTool(std::string_view serverId, std::string_view localName) const -> Result<Tool>;
    [[nodiscard]] auto invoke(std::string_view serverId, std::string_view localName, const nlohmann::json& arguments)
        -> Result<nlohmann::json>;

    [[nodiscard]] auto dispatchStreaming(const nlohmann::json& envelope, std::optional<std::string> sessionId)
        -> StreamingReply;
    [[nodiscard]] auto handleInitialize(const nlohmann::json& id,
                                        const nlohmann::json& params,
                                        const std::optional<std::string>& sessionId) -> StreamingReply;
    [[nodiscard]] auto handleToolsList() const -> nlohmann::json;
    [[nodiscard]] auto handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) -> nlohmann::json;

    [[nodiscard]] auto serverInfoJson(const ServerInfo& info) const -> nlohmann::json;

    ServerManager& _servers;
    ToolRegistry& _registry;
    SessionManager& _sessions;
};

} // namespace mcpgate
