// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/McpClient.hpp>
#include <mcp/RpcCorrelator.hpp>
#include <mcp/Transport.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief Callbacks through which a backend reports asynchronous events.
///
/// Both are invoked on the backend's reader thread and must only enqueue work.
struct BackendEvents
{
    std::function<void()> onToolsChanged;
    std::function<void(const Error& reason)> onExited;
};

/// @brief Runtime state of one enabled server: its process, correlator and protocol client.
///
/// The backend is invisible to routing until markReady(). After stop() it is inert.
class BackendProcess
{
  public:
    /// @brief Wraps a connected transport.
    /// @param id The server id.
    /// @param transport A transport connected to the running backend process.
    /// @param events Event callbacks.
    BackendProcess(std::string id, std::unique_ptr<Transport> transport, BackendEvents events);
    ~BackendProcess();

    BackendProcess(const BackendProcess&) = delete;
    BackendProcess& operator=(const BackendProcess&) = delete;

    /// @brief Starts reading, performs the initialize handshake and fetches the tool list.
    /// @param timeout Deadline for each handshake request.
    /// @return The tools the backend offers.
    [[nodiscard]] auto handshake(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>;

    /// @brief Fetches the tool list again.
    [[nodiscard]] auto refreshTools(std::chrono::milliseconds timeout) -> Result<std::vector<ToolDefinition>>;

    /// @brief Starts a tool call on this backend.
    /// @return A handle, or BackendUnavailable if the backend is not serving.
    [[nodiscard]] auto startToolCall(std::string_view localName,
                                     const nlohmann::json& arguments,
                                     std::chrono::milliseconds timeout) -> Result<CallHandle>;

    void markReady();

    /// @brief Marks the backend as alive but without a usable tool list.
    void markDegraded(const Error& reason);

    /// @brief Fails every pending call with the given reason without stopping the process.
    void failPending(const Error& reason);

    /// @brief Fails pending calls, stops the reader and terminates the process. Idempotent.
    /// @param reason Error delivered to calls still pending.
    void stop(const Error& reason);

    [[nodiscard]] auto id() const -> const std::string&;
    [[nodiscard]] auto state() const -> BackendState;
    [[nodiscard]] auto lastError() const -> std::optional<std::string>;
    [[nodiscard]] auto capabilities() const -> McpServerCapabilities;
    [[nodiscard]] auto pendingCount() const -> size_t;

  private:
    std::string _id;
    std::unique_ptr<Transport> _transport;
    RpcCorrelator _correlator;
    McpClient _client;
    BackendEvents _events;
    std::atomic<BackendState> _state = BackendState::Starting;
    mutable std::mutex _mutex;
    std::optional<std::string> _lastError;
    McpServerCapabilities _capabilities;
    bool _stopped = false;
};

} // namespace mcpgate
