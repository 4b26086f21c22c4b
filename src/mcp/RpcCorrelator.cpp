// SPDX-License-Identifier: Apache-2.0
#include "RpcCorrelator.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcpgate
{

namespace
{
    constexpr auto NotificationWriteTimeout = std::chrono::seconds(5);

    // Bounded so a stalled backend cannot hold up the reader thread for long.
    constexpr auto ReplyWriteTimeout = std::chrono::seconds(1);
} // namespace

RpcCorrelator::RpcCorrelator(std::string backendId, Transport& transport):
    _backendId(std::move(backendId)), _transport(transport), _pending(std::make_shared<PendingCallTable>())
{
}

RpcCorrelator::~RpcCorrelator()
{
    stop();
}

void RpcCorrelator::start(NotificationHandler onNotification, ClosedHandler onClosed)
{
    if (_reader.joinable())
        return;

    _onNotification = std::move(onNotification);
    _onClosed = std::move(onClosed);
    _reader = std::thread([this] { readLoop(); });
}

auto RpcCorrelator::sendRequest(std::string_view method,
                                nlohmann::json params,
                                std::chrono::milliseconds timeout) -> Result<CallHandle>
{
    auto call = std::make_shared<PendingCall>();
    call->id = _nextId.fetch_add(1);
    call->method = std::string(method);
    call->deadline = std::chrono::steady_clock::now() + timeout;

    // Registered before writing, so a fast response always finds its entry.
    if (auto inserted = _pending->insert(call); !inserted)
        return std::unexpected(inserted.error());

    auto handle = CallHandle(call, _pending);

    auto const request = jsonrpc::makeRequest(call->id, method, std::move(params));
    if (auto sent = _transport.send(request, call->deadline); !sent)
    {
        handle.cancel();
        if (sent.error().code == ErrorCode::CallTimeout)
            log::warning("[{}] #{} {} not accepted before its deadline", _backendId, call->id, method);
        return std::unexpected(sent.error());
    }

    log::trace("[{}] -> #{} {}", _backendId, call->id, method);
    return handle;
}

auto RpcCorrelator::call(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
    -> Result<nlohmann::json>
{
    return sendRequest(method, std::move(params), timeout).and_then([](CallHandle handle) {
        return handle.wait();
    });
}

auto RpcCorrelator::notify(std::string_view method, nlohmann::json params) -> VoidResult
{
    return _transport.send(jsonrpc::makeNotification(method, std::move(params)),
                           std::chrono::steady_clock::now() + NotificationWriteTimeout);
}

void RpcCorrelator::failAll(Error reason)
{
    auto const calls = _pending->close(reason);
    if (!calls.empty())
        log::debug("[{}] failing {} pending call(s): {}", _backendId, calls.size(), reason.message);

    for (const auto& call: calls)
        call->complete(std::unexpected(reason));
}

void RpcCorrelator::stop()
{
    _stopping = true;
    _transport.interrupt();

    if (_reader.joinable() && _reader.get_id() != std::this_thread::get_id())
        _reader.join();

    failAll(Error { ErrorCode::ShuttingDown, std::format("Backend '{}' is shutting down", _backendId) });
}

auto RpcCorrelator::pendingCount() const -> size_t
{
    return _pending->size();
}

auto RpcCorrelator::backendId() const -> const std::string&
{
    return _backendId;
}

void RpcCorrelator::readLoop()
{
    log::debug("[{}] reader started", _backendId);

    while (true)
    {
        auto message = _transport.receive();
        if (message)
        {
            dispatch(*message);
            continue;
        }

        if (message.error().code == ErrorCode::MalformedUpstreamMessage)
        {
            log::warning("[{}] discarding malformed message: {}", _backendId, message.error().message);
            continue;
        }

        if (_stopping)
            break;

        auto const reason = Error {
            ErrorCode::BackendUnavailable,
            std::format("Backend '{}' is unavailable: {}", _backendId, message.error().message),
        };
        log::warning("[{}] output stream ended: {}", _backendId, message.error().message);
        failAll(reason);
        if (_onClosed)
            _onClosed(reason);
        break;
    }

    log::debug("[{}] reader stopped", _backendId);
}

void RpcCorrelator::dispatch(const nlohmann::json& raw)
{
    auto parsed = jsonrpc::parseMessage(raw);
    if (!parsed)
    {
        // A broken answer to a pending call must reach its caller instead of timing out.
        if (raw.is_object() && raw.contains("id") && raw["id"].is_number_integer())
        {
            if (auto call = _pending->take(raw["id"].get<int64_t>()))
            {
                call->complete(makeError(ErrorCode::MalformedUpstreamMessage,
                                         std::format("Malformed response from '{}': {}",
                                                     _backendId,
                                                     parsed.error().message)));
                return;
            }
        }
        log::warning("[{}] discarding malformed message: {}", _backendId, parsed.error().message);
        return;
    }

    auto& msg = *parsed;
    switch (msg.kind)
    {
        case jsonrpc::MessageKind::Response: {
            auto call = msg.id.is_number_integer() ? _pending->take(msg.id.get<int64_t>()) : nullptr;
            if (!call)
            {
                log::debug("[{}] dropping response for unknown request id {}", _backendId, msg.id.dump());
                return;
            }

            log::trace("[{}] <- #{} {}", _backendId, call->id, call->method);
            if (msg.error)
            {
                call->complete(makeError(ErrorCode::UpstreamError,
                                         std::format("RPC error {}: {}", msg.error->code, msg.error->message)));
            }
            else
            {
                call->complete(std::move(*msg.result));
            }
            return;
        }
        case jsonrpc::MessageKind::Request: answerBackendRequest(msg); return;
        case jsonrpc::MessageKind::Notification:
            log::debug("[{}] notification: {}", _backendId, msg.method);
            if (_onNotification)
                _onNotification(msg);
            return;
    }
}

void RpcCorrelator::answerBackendRequest(const jsonrpc::Message& request)
{
    auto const reply = request.method == "ping"
                           ? jsonrpc::makeResult(request.id, nlohmann::json::object())
                           : jsonrpc::makeErrorResponse(request.id,
                                                        jsonrpc::codes::MethodNotFound,
                                                        std::format("Method not found: {}", request.method));

    if (auto sent = _transport.send(reply, std::chrono::steady_clock::now() + ReplyWriteTimeout); !sent)
        log::warning("[{}] failed to answer '{}': {}", _backendId, request.method, sent.error().message);
}

} // namespace mcpgate
