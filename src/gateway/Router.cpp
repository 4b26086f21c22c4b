// SPDX-License-Identifier: Apache-2.0
#include "Router.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <gateway/OpenApiSchema.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/McpClient.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>

namespace mcpgate
{

namespace
{
    auto jsonResponse(int status, const nlohmann::json& body) -> http::Response
    {
        return http::Response { .status = status, .body = body.dump() };
    }

    auto errorResponse(const Error& error) -> http::Response
    {
        return jsonResponse(httpStatusFor(error.code), makeErrorBody(error));
    }

    auto isBlank(std::string_view text) -> bool
    {
        return std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c) != 0; });
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(
            result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /// Accepts the argument object itself or `{"arguments": {...}}`.
    auto parseArguments(std::string_view body) -> Result<nlohmann::json>
    {
        if (isBlank(body))
            return nlohmann::json::object();

        auto parsed = json::parse(body, ErrorCode::InvalidArgument);
        if (!parsed)
            return std::unexpected(parsed.error());
        if (!parsed->is_object())
            return makeError(ErrorCode::InvalidArgument, "Request body must be a JSON object");

        if (!parsed->contains("arguments"))
            return std::move(*parsed);

        auto arguments = (*parsed)["arguments"];
        if (arguments.is_null())
            return nlohmann::json::object();
        if (!arguments.is_object())
            return makeError(ErrorCode::InvalidArgument, "'arguments' must be a JSON object");
        return arguments;
    }

    auto rpcError(const nlohmann::json& id, const Error& error) -> nlohmann::json
    {
        return jsonrpc::makeErrorResponse(
            id, rpcErrorCodeFor(error.code), error.message, { { "kind", errorCodeName(error.code) } });
    }

    /// HTTP status of a streaming reply that carries a session-level error.
    auto streamingStatusFor(ErrorCode code) -> int
    {
        switch (code)
        {
            case ErrorCode::SessionNotInitialized: return 400;
            case ErrorCode::SessionExpired: return 404;
            default: return 200;
        }
    }
} // namespace

auto httpStatusFor(ErrorCode code) -> int
{
    switch (code)
    {
        case ErrorCode::ToolNotFound:
        case ErrorCode::ServerNotFound: return 404;
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidRequest:
        case ErrorCode::SessionNotInitialized: return 400;
        case ErrorCode::SessionExpired: return 404;
        case ErrorCode::BackendUnavailable:
        case ErrorCode::ShuttingDown: return 503;
        case ErrorCode::CallTimeout: return 504;
        case ErrorCode::MalformedUpstreamMessage:
        case ErrorCode::UpstreamError: return 502;
        default: return 500;
    }
}

auto rpcErrorCodeFor(ErrorCode code) -> int
{
    switch (code)
    {
        case ErrorCode::InvalidRequest: return jsonrpc::codes::InvalidRequest;
        case ErrorCode::MethodNotFound: return jsonrpc::codes::MethodNotFound;
        case ErrorCode::InvalidArgument:
        case ErrorCode::ToolNotFound: return jsonrpc::codes::InvalidParams;
        case ErrorCode::SessionNotInitialized: return jsonrpc::codes::SessionNotInitialized;
        case ErrorCode::SessionExpired: return jsonrpc::codes::SessionExpired;
        default: return jsonrpc::codes::InternalError;
    }
}

auto makeErrorBody(const Error& error) -> nlohmann::json
{
    return { { "error", { { "kind", errorCodeName(error.code) }, { "message", error.message } } } };
}

Router::Router(ServerManager& servers, ToolRegistry& registry, SessionManager& sessions):
    _servers(servers), _registry(registry), _sessions(sessions)
{
}

void Router::registerRoutes(http::HttpServer& server)
{
    using http::Method;

    server.addHandler(Method::Get, "/health", [this](const http::Request&) { return handleHealth(); });
    server.addHandler(Method::Get, "/tools/openapi.json", [this](const http::Request&) { return handleOpenApi(); });
    server.addHandler(Method::Post, "/tools/:server/:tool", [this](const http::Request& req) {
        return handleToolCall(req.param("server"), req.param("tool"), req.body);
    });

    server.addHandler(Method::Post, "/mcp", [this](const http::Request& req) { return handleStreamingPost(req); });
    server.addHandler(Method::Get, "/mcp", [this](const http::Request& req) { return handleStreamingGet(req); });
    server.addHandler(
        Method::Delete, "/mcp", [this](const http::Request& req) { return handleStreamingDelete(req); });

    server.addHandler(Method::Get, "/api/servers", [this](const http::Request&) { return handleListServers(); });
    server.addHandler(Method::Get, "/api/servers/:id", [this](const http::Request& req) {
        return handleGetServer(req.param("id"));
    });
    server.addHandler(Method::Patch, "/api/servers/:id", [this](const http::Request& req) {
        return handlePatchServer(req.param("id"), req.body);
    });
    server.addHandler(Method::Get, "/api/tools", [this](const http::Request& req) {
        auto const it = req.query.find("search");
        return handleListTools(it != req.query.end() ? it->second : std::string {});
    });
    server.addHandler(Method::Get, "/api/tools/:server/:tool", [this](const http::Request& req) {
        return handleGetTool(req.param("server"), req.param("tool"));
    });
    server.addHandler(Method::Post, "/api/tools/:server/:tool", [this](const http::Request& req) {
        return handleInvokeTool(req.param("server"), req.param("tool"), req.body);
    });
}

// {{{ REST surface

auto Router::handleToolCall(std::string_view serverId, std::string_view toolName, std::string_view body)
    -> http::Response
{
    auto arguments = parseArguments(body);
    if (!arguments)
        return errorResponse(arguments.error());

    auto result = invoke(serverId, toolName, *arguments);
    if (!result)
    {
        log::warning("Tool call {}/{} failed: {}", serverId, toolName, result.error());
        return errorResponse(result.error());
    }

    return jsonResponse(200, *result);
}

auto Router::resolveTool(std::string_view serverId, std::string_view localName) const -> Result<Tool>
{
    auto const catalog = _registry.snapshot();
    if (auto const* tool = catalog->find(serverId, localName))
        return *tool;

    if (auto const info = _servers.serverInfo(serverId); info && info->enabled && info->state != BackendState::Ready)
    {
        return makeError(ErrorCode::BackendUnavailable,
                         info->error ? std::format("Server {} is {}: {}",
                                                   serverId,
                                                   backendStateToString(info->state),
                                                   *info->error)
                                     : std::format("Server {} is {}", serverId, backendStateToString(info->state)));
    }

    return makeError(ErrorCode::ToolNotFound, std::format("Tool {} not found", makeNamespacedName(serverId, localName)));
}

auto Router::invoke(std::string_view serverId, std::string_view localName, const nlohmann::json& arguments)
    -> Result<nlohmann::json>
{
    if (_servers.isShuttingDown())
        return makeError(ErrorCode::ShuttingDown, "Gateway is shutting down");

    return resolveTool(serverId, localName).and_then([&](const Tool& tool) {
        log::debug("Calling {}", tool.namespacedName);
        return _servers.callTool(tool.serverId, tool.localName, arguments);
    });
}

// }}}

// {{{ Streaming surface

auto Router::handleStreamingPost(const http::Request& request) -> http::Response
{
    if (auto const version = request.header("MCP-Protocol-Version"); version && *version != McpProtocolVersion)
        log::debug("Client announced protocol version {}", *version);

    auto envelope = json::parse(request.body, ErrorCode::InvalidArgument);
    if (!envelope)
    {
        return jsonResponse(
            400,
            jsonrpc::makeErrorResponse(nullptr, jsonrpc::codes::ParseError, envelope.error().message));
    }

    auto reply = dispatchStreaming(*envelope, request.header(SessionHeader));

    auto response = http::Response { .status = reply.status };
    if (!reply.body.is_null())
        response.body = reply.body.dump();
    if (!reply.sessionId.empty())
        response.headers.emplace(SessionHeader, reply.sessionId);
    return response;
}

auto Router::dispatchStreaming(const nlohmann::json& envelope, std::optional<std::string> sessionId)
    -> StreamingReply
{
    auto message = jsonrpc::parseMessage(envelope);
    if (!message)
    {
        auto const id = envelope.is_object() ? envelope.value("id", nlohmann::json {}) : nlohmann::json {};
        return { .status = 400,
                 .body = jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidRequest, "Invalid JSON-RPC request"),
                 .sessionId = {} };
    }

    // Responses to server-initiated requests; the gateway never sends any.
    if (message->kind == jsonrpc::MessageKind::Response)
        return { .status = 202, .body = nullptr, .sessionId = {} };

    if (message->kind == jsonrpc::MessageKind::Notification)
    {
        if (!sessionId)
            return { .status = 202, .body = nullptr, .sessionId = {} };

        auto state = _sessions.touch(*sessionId);
        if (!state)
            return { .status = streamingStatusFor(state.error().code),
                     .body = rpcError(nullptr, state.error()),
                     .sessionId = {} };

        if (message->method == "notifications/initialized")
            _sessions.markActive(*sessionId);
        else
            log::debug("Ignoring notification {}", message->method);
        return { .status = 202, .body = nullptr, .sessionId = *sessionId };
    }

    auto const& id = message->id;
    if (message->method == "initialize")
        return handleInitialize(id, message->params, sessionId);

    if (!sessionId)
    {
        auto const error = Error { ErrorCode::SessionNotInitialized, "Session required; call initialize first" };
        return { .status = 400, .body = rpcError(id, error), .sessionId = {} };
    }

    if (auto state = _sessions.touch(*sessionId); !state)
        return { .status = streamingStatusFor(state.error().code), .body = rpcError(id, state.error()), .sessionId = {} };

    auto body = nlohmann::json {};
    if (message->method == "ping")
        body = jsonrpc::makeResult(id, nlohmann::json::object());
    else if (message->method == "tools/list")
        body = jsonrpc::makeResult(id, handleToolsList());
    else if (message->method == "tools/call")
        body = handleToolsCall(id, message->params);
    else
        body = jsonrpc::makeErrorResponse(
            id, jsonrpc::codes::MethodNotFound, std::format("Method not found: {}", message->method));

    if (body.contains("result"))
        _sessions.markActive(*sessionId);

    return { .status = 200, .body = std::move(body), .sessionId = *sessionId };
}

auto Router::handleInitialize(const nlohmann::json& id,
                              const nlohmann::json& params,
                              const std::optional<std::string>& sessionId) -> StreamingReply
{
    if (sessionId)
    {
        if (auto const info = _sessions.info(*sessionId); info && info->state != SessionState::Closed)
        {
            auto const error = Error { ErrorCode::InvalidRequest, "Session is already initialized" };
            return { .status = 400, .body = rpcError(id, error), .sessionId = *sessionId };
        }
    }

    auto const clientInfo = params.is_object() ? params.value("clientInfo", nlohmann::json::object())
                                               : nlohmann::json::object();
    auto const clientName = json::getStringOr(clientInfo, "name", "unknown");
    auto const requestedVersion =
        json::getStringOr(params, "protocolVersion", std::string(McpProtocolVersion));
    if (requestedVersion != McpProtocolVersion)
        log::info("Client {} requested protocol {}, offering {}", clientName, requestedVersion, McpProtocolVersion);

    auto created = _sessions.create(clientName, std::string(McpProtocolVersion));
    if (!created)
        return { .status = httpStatusFor(created.error().code), .body = rpcError(id, created.error()), .sessionId = {} };

    log::info("Streaming client {} connected", clientName);

    auto result = nlohmann::json {
        { "protocolVersion", McpProtocolVersion },
        { "capabilities", { { "tools", { { "listChanged", false } } } } },
        { "serverInfo", { { "name", "mcpgate" }, { "version", GatewayVersion } } },
    };
    return { .status = 200, .body = jsonrpc::makeResult(id, std::move(result)), .sessionId = *created };
}

auto Router::handleToolsList() const -> nlohmann::json
{
    auto const catalog = _registry.snapshot();

    auto tools = nlohmann::json::array();
    for (const auto& [name, tool]: catalog->tools)
    {
        tools.push_back({
            { "name", tool.namespacedName },
            { "description", std::format("[{}] {}", tool.serverId, tool.description) },
            { "inputSchema", tool.inputSchema },
        });
    }
    return { { "tools", std::move(tools) } };
}

auto Router::handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) -> nlohmann::json
{
    auto const name = json::getString(params, "name");
    if (!name)
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "Missing tool name");

    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null())
        arguments = nlohmann::json::object();
    if (!arguments.is_object())
        return jsonrpc::makeErrorResponse(id, jsonrpc::codes::InvalidParams, "Tool arguments must be an object");

    auto const parts = splitNamespacedName(*name);
    if (!parts)
    {
        return jsonrpc::makeErrorResponse(
            id,
            jsonrpc::codes::InvalidParams,
            std::format("Invalid tool name format: {}. Expected: server_id__tool_name", *name));
    }

    auto result = invoke(parts->first, parts->second, arguments);
    if (!result)
    {
        log::warning("Tool call {} failed: {}", *name, result.error());
        return rpcError(id, result.error());
    }

    return jsonrpc::makeResult(id, std::move(*result));
}

auto Router::handleStreamingDelete(const http::Request& request) -> http::Response
{
    auto const sessionId = request.header(SessionHeader);
    if (!sessionId)
        return errorResponse(Error { ErrorCode::InvalidRequest, "Missing Mcp-Session-Id header" });

    if (auto closed = _sessions.close(*sessionId); !closed)
        return jsonResponse(404, makeErrorBody(closed.error()));

    log::info("Streaming session closed by client");
    return http::Response { .status = 204 };
}

auto Router::handleStreamingGet(const http::Request&) -> http::Response
{
    return http::Response {
        .status = 405,
        .body = makeErrorBody(Error { ErrorCode::InvalidRequest, "Server-initiated stream not supported" }).dump(),
        .headers = { { "Allow", "POST, DELETE" } },
    };
}

// }}}

auto Router::handleOpenApi() -> http::Response
{
    return jsonResponse(200, renderOpenApiDocument(*_registry.snapshot()));
}

auto Router::handleHealth() -> http::Response
{
    auto const servers = _servers.allServers();

    auto backends = nlohmann::json::array();
    auto ready = size_t { 0 };
    auto enabled = size_t { 0 };
    for (const auto& info: servers)
    {
        if (info.enabled)
            ++enabled;
        if (info.state == BackendState::Ready)
            ++ready;
        if (info.enabled)
        {
            backends.push_back({
                { "id", info.id },
                { "state", backendStateToString(info.state) },
                { "tools", info.tools.size() },
            });
        }
    }

    return jsonResponse(200,
                        {
                            { "status", _servers.isShuttingDown() ? "shutting_down" : "healthy" },
                            { "servers_configured", servers.size() },
                            { "servers_enabled", enabled },
                            { "servers_ready", ready },
                            { "sessions_open", _sessions.openCount() },
                            { "backends", std::move(backends) },
                        });
}

// {{{ Administration API

auto Router::serverInfoJson(const ServerInfo& info) const -> nlohmann::json
{
    auto result = nlohmann::json {
        { "id", info.id },
        { "enabled", info.enabled },
        { "state", backendStateToString(info.state) },
        { "tools", info.tools },
        { "pending_calls", info.pendingCalls },
        { "error", info.error ? nlohmann::json(*info.error) : nlohmann::json(nullptr) },
    };
    if (!info.serverName.empty())
        result["server_info"] = { { "name", info.serverName }, { "version", info.serverVersion } };
    return result;
}

auto Router::handleListServers() -> http::Response
{
    auto servers = nlohmann::json::array();
    for (const auto& info: _servers.allServers())
        servers.push_back(serverInfoJson(info));
    return jsonResponse(200, { { "servers", std::move(servers) } });
}

auto Router::handleGetServer(std::string_view serverId) -> http::Response
{
    auto const info = _servers.serverInfo(serverId);
    if (!info)
        return errorResponse(Error { ErrorCode::ServerNotFound, std::format("Server {} not found", serverId) });
    return jsonResponse(200, serverInfoJson(*info));
}

auto Router::handlePatchServer(std::string_view serverId, std::string_view body) -> http::Response
{
    auto parsed = json::parse(body, ErrorCode::InvalidArgument);
    if (!parsed)
        return errorResponse(parsed.error());
    if (!parsed->is_object() || !parsed->contains("enabled") || !(*parsed)["enabled"].is_boolean())
        return errorResponse(Error { ErrorCode::InvalidArgument, "Body must be {\"enabled\": true|false}" });

    auto const enable = (*parsed)["enabled"].get<bool>();
    auto const result = enable ? _servers.enableServer(serverId) : _servers.disableServer(serverId);
    if (!result)
        return errorResponse(result.error());

    return handleGetServer(serverId);
}

auto Router::handleListTools(std::string_view search) -> http::Response
{
    auto const needle = toLower(search);
    auto const catalog = _registry.snapshot();

    auto tools = nlohmann::json::array();
    for (const auto& [name, tool]: catalog->tools)
    {
        if (!needle.empty() && !toLower(tool.localName).contains(needle))
            continue;
        tools.push_back({
            { "server_id", tool.serverId },
            { "name", tool.localName },
            { "namespaced_name", tool.namespacedName },
            { "description", tool.description },
        });
    }
    return jsonResponse(200, { { "tools", std::move(tools) } });
}

auto Router::handleGetTool(std::string_view serverId, std::string_view toolName) -> http::Response
{
    auto const tool = resolveTool(serverId, toolName);
    if (!tool)
        return errorResponse(tool.error());

    return jsonResponse(200,
                        {
                            { "server_id", tool->serverId },
                            { "name", tool->localName },
                            { "namespaced_name", tool->namespacedName },
                            { "description", tool->description },
                            { "input_schema", tool->inputSchema },
                        });
}

auto Router::handleInvokeTool(std::string_view serverId, std::string_view toolName, std::string_view body)
    -> http::Response
{
    auto const start = std::chrono::steady_clock::now();
    auto const elapsedMs = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    auto arguments = parseArguments(body);
    if (!arguments)
        return errorResponse(arguments.error());

    auto result = invoke(serverId, toolName, *arguments);
    if (!result)
    {
        log::warning("Tool call {}/{} failed: {}", serverId, toolName, result.error());
        return jsonResponse(200,
                            {
                                { "success", false },
                                { "result", nullptr },
                                { "error", std::format("{}", result.error()) },
                                { "duration_ms", elapsedMs() },
                            });
    }

    return jsonResponse(200,
                        {
                            { "success", true },
                            { "result", std::move(*result) },
                            { "error", nullptr },
                            { "duration_ms", elapsedMs() },
                        });
}

// }}}

} // namespace mcpgate
