// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <format>

namespace mcpgate::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeResult(nlohmann::json id, nlohmann::json result) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "result", std::move(result) },
    };
}

auto makeErrorResponse(nlohmann::json id, int code, std::string_view message, nlohmann::json data)
    -> nlohmann::json
{
    auto error = nlohmann::json {
        { "code", code },
        { "message", message },
    };

    if (!data.is_null())
        error["data"] = std::move(data);

    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", std::move(id) },
        { "error", std::move(error) },
    };
}

auto parseMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::MalformedUpstreamMessage, "Not a valid JSON-RPC 2.0 message");

    auto parsed = Message {};

    if (message.contains("id"))
    {
        parsed.id = message["id"];
        if (!parsed.id.is_null() && !parsed.id.is_number_integer() && !parsed.id.is_string())
            return makeError(ErrorCode::MalformedUpstreamMessage, "JSON-RPC id must be an integer or string");
    }

    if (message.contains("method"))
    {
        if (!message["method"].is_string())
            return makeError(ErrorCode::MalformedUpstreamMessage, "JSON-RPC method must be a string");

        parsed.method = message["method"].get<std::string>();
        parsed.params = message.value("params", nlohmann::json {});
        parsed.kind = parsed.id.is_null() ? MessageKind::Notification : MessageKind::Request;
        return parsed;
    }

    parsed.kind = MessageKind::Response;

    if (message.contains("result"))
    {
        parsed.result = message["result"];
    }
    else if (message.contains("error") && message["error"].is_object())
    {
        auto const& err = message["error"];
        parsed.error = RpcError {
            .code = err.contains("code") && err["code"].is_number_integer() ? err["code"].get<int>() : 0,
            .message = err.contains("message") && err["message"].is_string()
                           ? err["message"].get<std::string>()
                           : std::string("Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }
    else
    {
        return makeError(ErrorCode::MalformedUpstreamMessage,
                         std::format("JSON-RPC message {} has neither result, error, nor method",
                                     parsed.id.dump()));
    }

    return parsed;
}

} // namespace mcpgate::jsonrpc
