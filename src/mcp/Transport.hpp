// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace mcpgate
{

/// @brief Point in time by which a blocking transport operation must finish.
using Deadline = std::chrono::steady_clock::time_point;

/// @brief Abstract interface for line-delimited JSON-RPC communication with a backend.
///
/// One reader thread calls receive(); any number of threads may call send().
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the backend.
    ///
    /// Each message is written as one unit; concurrent senders never interleave bytes.
    /// A backend that stops draining its input must not block the sender past the deadline.
    /// @param message The JSON message to send.
    /// @param deadline When to give up waiting for the backend to accept the message.
    /// @return Success, CallTimeout if the deadline passed, or another error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message, Deadline deadline) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the backend (blocking).
    ///
    /// A line that is not valid JSON yields ErrorCode::MalformedUpstreamMessage and the
    /// stream stays usable. End of stream or interruption yields ErrorCode::BackendUnavailable.
    /// @return The received JSON message or an error.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Unblocks a pending receive(); all later receive() calls fail.
    virtual void interrupt() = 0;

    /// @brief Closes the transport connection.
    ///
    /// Must not run concurrently with receive(): interrupt() and join the reader first.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace mcpgate
