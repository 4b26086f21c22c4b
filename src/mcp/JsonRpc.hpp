// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcpgate::jsonrpc
{

/// @brief Standard and gateway-specific JSON-RPC error codes.
namespace codes
{
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
    constexpr int SessionNotInitialized = -32000;
    constexpr int SessionExpired = -32001;
} // namespace codes

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Classification of an inbound JSON-RPC message.
enum class MessageKind
{
    Request,
    Notification,
    Response,
};

/// @brief Represents a parsed JSON-RPC 2.0 message of any kind.
struct Message
{
    MessageKind kind = MessageKind::Notification;
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this is a response indicating success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }
};

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 success response.
[[nodiscard]] auto makeResult(nlohmann::json id, nlohmann::json result) -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response.
/// @param id The request ID (null when the request could not be identified).
/// @param code The JSON-RPC error code.
/// @param message Human-readable error message.
/// @param data Optional structured data; omitted when null.
[[nodiscard]] auto makeErrorResponse(nlohmann::json id,
                                     int code,
                                     std::string_view message,
                                     nlohmann::json data = nullptr) -> nlohmann::json;

/// @brief Parses and classifies a JSON-RPC 2.0 message.
///
/// A message with a method is a request (id present and non-null) or a notification.
/// A message without a method must carry an id and either result or error.
/// @param message The JSON message to parse.
/// @return The parsed message or a MalformedUpstreamMessage error.
[[nodiscard]] auto parseMessage(const nlohmann::json& message) -> Result<Message>;

} // namespace mcpgate::jsonrpc
