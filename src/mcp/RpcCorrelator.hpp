// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/PendingCall.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace mcpgate
{

/// @brief Callback for messages from the backend that do not answer a pending call.
using NotificationHandler = std::function<void(const jsonrpc::Message& message)>;

/// @brief Callback invoked once when the backend's output stream ends unexpectedly.
using ClosedHandler = std::function<void(const Error& reason)>;

/// @brief Matches JSON-RPC responses from one backend to the requests that caused them.
///
/// Owns the single reader thread of its transport. Request ids are allocated from a
/// per-backend counter and are never reused while a call with that id is pending.
class RpcCorrelator
{
  public:
    /// @brief Constructs a correlator over a transport it does not own.
    /// @param backendId Id of the backend, used in diagnostics.
    /// @param transport The transport; must outlive the correlator.
    RpcCorrelator(std::string backendId, Transport& transport);
    ~RpcCorrelator();

    RpcCorrelator(const RpcCorrelator&) = delete;
    RpcCorrelator& operator=(const RpcCorrelator&) = delete;

    /// @brief Starts the reader thread.
    /// @param onNotification Receives notifications; called on the reader thread, must not block.
    /// @param onClosed Called on the reader thread when the stream ends without stop().
    void start(NotificationHandler onNotification, ClosedHandler onClosed);

    /// @brief Sends a request and registers it as pending.
    /// @param method The JSON-RPC method.
    /// @param params The request parameters.
    /// @param timeout Time until the call fails with CallTimeout.
    /// @return A handle to wait on, or the error that prevented sending.
    [[nodiscard]] auto sendRequest(std::string_view method,
                                   nlohmann::json params,
                                   std::chrono::milliseconds timeout) -> Result<CallHandle>;

    /// @brief Sends a request and waits for its result.
    [[nodiscard]] auto call(std::string_view method, nlohmann::json params, std::chrono::milliseconds timeout)
        -> Result<nlohmann::json>;

    /// @brief Sends a notification (no response expected).
    [[nodiscard]] auto notify(std::string_view method, nlohmann::json params = nullptr) -> VoidResult;

    /// @brief Fails all pending calls with the given reason and refuses new ones.
    void failAll(Error reason);

    /// @brief Interrupts the transport and joins the reader thread.
    ///
    /// Pending calls are failed with ShuttingDown unless failAll() ran before.
    void stop();

    /// @brief Returns the number of calls currently awaiting a response.
    [[nodiscard]] auto pendingCount() const -> size_t;

    /// @brief Returns the backend id.
    [[nodiscard]] auto backendId() const -> const std::string&;

  private:
    std::string _backendId;
    Transport& _transport;
    std::shared_ptr<PendingCallTable> _pending;
    std::atomic<int64_t> _nextId = 1;
    std::atomic<bool> _stopping = false;
    NotificationHandler _onNotification;
    ClosedHandler _onClosed;
    std::thread _reader;

    void readLoop();
    void dispatch(const nlohmann::json& raw);
    void answerBackendRequest(const jsonrpc::Message& request);
};

} // namespace mcpgate
