// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gateway/ServerManager.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mcpgate::test
{

/// @brief In-memory transport: tests push inbound messages and inspect what was sent.
///
/// receive() blocks until a message is pushed, the peer closes, or the transport is
/// interrupted, mirroring the behavior of a real process pipe.
class MockTransport: public Transport
{
  public:
    /// @brief Called for every sent message, outside the lock. May push replies.
    std::function<void(const nlohmann::json&)> onSend;

    void push(nlohmann::json message) { pushResult(std::move(message)); }

    /// @brief Queues an unparseable line.
    void pushMalformed() { pushResult(makeError(ErrorCode::MalformedUpstreamMessage, "JSON parse error")); }

    /// @brief Simulates the backend closing its output.
    void closeFromPeer()
    {
        {
            auto const lock = std::lock_guard { _mutex };
            _peerClosed = true;
        }
        _signal.notify_all();
    }

    [[nodiscard]] auto sent() const -> std::vector<nlohmann::json>
    {
        auto const lock = std::lock_guard { _mutex };
        return _sent;
    }

    /// @brief Waits until at least `count` messages have been sent.
    [[nodiscard]] auto waitForSent(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5))
        -> bool
    {
        auto lock = std::unique_lock { _mutex };
        return _signal.wait_for(lock, timeout, [&] { return _sent.size() >= count; });
    }

    auto send(const nlohmann::json& message, Deadline /*deadline*/) -> VoidResult override
    {
        {
            auto const lock = std::lock_guard { _mutex };
            if (_closed || _peerClosed)
                return makeError(ErrorCode::BackendUnavailable, "Mock transport closed");
            _sent.push_back(message);
        }
        _signal.notify_all();

        if (onSend)
            onSend(message);
        return {};
    }

    auto receive() -> Result<nlohmann::json> override
    {
        auto lock = std::unique_lock { _mutex };
        _signal.wait(lock, [this] { return !_inbound.empty() || _peerClosed || _interrupted; });

        if (!_inbound.empty())
        {
            auto next = std::move(_inbound.front());
            _inbound.pop_front();
            return next;
        }
        return makeError(ErrorCode::BackendUnavailable, _interrupted ? "Mock interrupted" : "Mock peer closed");
    }

    void interrupt() override
    {
        {
            auto const lock = std::lock_guard { _mutex };
            _interrupted = true;
        }
        _signal.notify_all();
    }

    void close() override
    {
        {
            auto const lock = std::lock_guard { _mutex };
            _closed = true;
            _interrupted = true;
        }
        _signal.notify_all();
    }

    [[nodiscard]] auto isConnected() const -> bool override
    {
        auto const lock = std::lock_guard { _mutex };
        return !_closed && !_peerClosed;
    }

  private:
    void pushResult(Result<nlohmann::json> message)
    {
        {
            auto const lock = std::lock_guard { _mutex };
            _inbound.push_back(std::move(message));
        }
        _signal.notify_all();
    }

    mutable std::mutex _mutex;
    std::condition_variable _signal;
    std::deque<Result<nlohmann::json>> _inbound;
    std::vector<nlohmann::json> _sent;
    bool _peerClosed = false;
    bool _interrupted = false;
    bool _closed = false;
};

/// @brief Installs an onSend hook that answers initialize and tools/list like a healthy backend.
///
/// Other requests are passed to `handler`, which returns the result to send or null to stay silent.
inline void respondAsToolServer(MockTransport& transport,
                                std::vector<std::string> toolNames,
                                std::function<nlohmann::json(const nlohmann::json&)> handler = {})
{
    transport.onSend = [&transport, toolNames = std::move(toolNames), handler = std::move(handler)](
                           const nlohmann::json& message) {
        if (!message.contains("id") || !message.contains("method"))
            return;

        auto const& method = message["method"];
        if (method == "initialize")
        {
            transport.push(jsonrpc::makeResult(
                message["id"],
                { { "protocolVersion", "2025-06-18" },
                  { "serverInfo", { { "name", "mock" }, { "version", "1.0" } } },
                  { "capabilities", { { "tools", { { "listChanged", true } } } } } }));
        }
        else if (method == "tools/list")
        {
            auto tools = nlohmann::json::array();
            for (const auto& name: toolNames)
            {
                tools.push_back({ { "name", name },
                                  { "description", "Mock tool " + name },
                                  { "inputSchema", { { "type", "object" } } } });
            }
            transport.push(jsonrpc::makeResult(message["id"], { { "tools", tools } }));
        }
        else if (handler)
        {
            if (auto result = handler(message); !result.is_null())
                transport.push(jsonrpc::makeResult(message["id"], std::move(result)));
        }
    };
}

/// @brief Transport factory handing out in-memory transports that act as tool servers.
///
/// Tools are configured per server id; a definition whose command is "fail" cannot be spawned.
struct MockBackends
{
    std::mutex mutex;
    std::map<std::string, std::vector<std::string>> tools;
    std::map<std::string, MockTransport*> transports;
    std::function<nlohmann::json(const nlohmann::json&)> handler;
    bool refuseInitialize = false;
    int created = 0;

    [[nodiscard]] auto factory() -> TransportFactory
    {
        return [this](const ServerDefinition& definition,
                      const ServerManagerOptions&) -> Result<std::unique_ptr<Transport>> {
            if (definition.command == "fail")
                return makeError(ErrorCode::SpawnError, "no such command");

            auto transport = std::make_unique<MockTransport>();
            auto const lock = std::lock_guard { mutex };
            if (refuseInitialize)
            {
                auto* raw = transport.get();
                transport->onSend = [raw](const nlohmann::json& message) {
                    if (message.contains("id"))
                        raw->push(jsonrpc::makeErrorResponse(message["id"], -32603, "refused"));
                };
            }
            else
            {
                respondAsToolServer(*transport, tools[definition.id], handler);
            }
            transports[definition.id] = transport.get();
            ++created;
            return std::unique_ptr<Transport>(std::move(transport));
        };
    }

    /// @brief Returns the transport most recently created for a server. Valid while it is enabled.
    [[nodiscard]] auto transport(const std::string& id) -> MockTransport&
    {
        auto const lock = std::lock_guard { mutex };
        return *transports.at(id);
    }
};

/// @brief Polls `predicate` until it holds or the timeout passes.
template <typename Predicate>
[[nodiscard]] auto eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5))
    -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

} // namespace mcpgate::test
