// SPDX-License-Identifier: Apache-2.0
#include "BackendProcess.hpp"

#include <core/Log.hpp>

#include <format>

namespace mcpgate
{

BackendProcess::BackendProcess(std::string id, std::unique_ptr<Transport> transport, BackendEvents events):
    _id(std::move(id)),
    _transport(std::move(transport)),
    _correlator(_id, *_transport),
    _client(_correlator),
    _events(std::move(events))
{
}

BackendProcess::~BackendProcess()
{
    stop(Error { ErrorCode::ShuttingDown, std::format("Backend '{}' destroyed", _id) });
}

auto BackendProcess::handshake(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>
{
    _correlator.start(
        [this](const jsonrpc::Message& message) {
            if (message.method == "notifications/tools/list_changed" && _events.onToolsChanged)
                _events.onToolsChanged();
        },
        [this](const Error& reason) {
            _state = BackendState::Stopped;
            {
                auto const lock = std::lock_guard { _mutex };
                _lastError = reason.message;
            }
            if (_events.onExited)
                _events.onExited(reason);
        });

    auto initialized = _client.initialize(timeout);
    if (!initialized)
        return std::unexpected(initialized.error());

    {
        auto const lock = std::lock_guard { _mutex };
        _capabilities = *initialized;
    }

    if (!initialized->hasTools)
        log::warning("[{}] backend does not advertise the tools capability", _id);

    return _client.listTools(timeout);
}

auto BackendProcess::refreshTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>
{
    if (state() == BackendState::Stopped)
        return makeError(ErrorCode::BackendUnavailable, std::format("Backend '{}' is stopped", _id));
    return _client.listTools(timeout);
}

auto BackendProcess::startToolCall(std::string_view localName,
                                   const nlohmann::json& arguments,
                                   std::chrono::milliseconds timeout) -> Result<CallHandle>
{
    switch (state())
    {
        case BackendState::Ready:
        case BackendState::Degraded: break;
        case BackendState::Starting:
            return makeError(ErrorCode::BackendUnavailable, std::format("Backend '{}' is still starting", _id));
        case BackendState::Stopped:
            return makeError(ErrorCode::BackendUnavailable, std::format("Backend '{}' is not running", _id));
    }
    return _client.startToolCall(localName, arguments, timeout);
}

void BackendProcess::markReady()
{
    auto expected = BackendState::Starting;
    if (!_state.compare_exchange_strong(expected, BackendState::Ready))
    {
        expected = BackendState::Degraded;
        _state.compare_exchange_strong(expected, BackendState::Ready);
    }

    auto const lock = std::lock_guard { _mutex };
    _lastError.reset();
}

void BackendProcess::markDegraded(const Error& reason)
{
    auto expected = BackendState::Ready;
    _state.compare_exchange_strong(expected, BackendState::Degraded);

    auto const lock = std::lock_guard { _mutex };
    _lastError = reason.message;
}

void BackendProcess::failPending(const Error& reason)
{
    _correlator.failAll(reason);
}

void BackendProcess::stop(const Error& reason)
{
    {
        auto const lock = std::lock_guard { _mutex };
        if (_stopped)
            return;
        _stopped = true;
    }

    _state = BackendState::Stopped;
    _correlator.failAll(reason);
    _correlator.stop();
    _transport->close();
    log::info("[{}] backend stopped", _id);
}

auto BackendProcess::id() const -> const std::string&
{
    return _id;
}

auto BackendProcess::state() const -> BackendState
{
    return _state;
}

auto BackendProcess::lastError() const -> std::optional<std::string>
{
    auto const lock = std::lock_guard { _mutex };
    return _lastError;
}

auto BackendProcess::capabilities() const -> McpServerCapabilities
{
    auto const lock = std::lock_guard { _mutex };
    return _capabilities;
}

auto BackendProcess::pendingCount() const -> size_t
{
    return _correlator.pendingCount();
}

} // namespace mcpgate
