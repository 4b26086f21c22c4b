// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <string_view>
#include <thread>

namespace mcpgate
{

/// @brief Lifecycle state of a streaming-surface session.
enum class SessionState
{
    Uninitialized,
    Initialized, ///< initialize succeeded, no other method completed yet
    Active,
    Closed,
};

[[nodiscard]] constexpr auto sessionStateToString(SessionState state) -> std::string_view
{
    switch (state)
    {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initialized: return "initialized";
        case SessionState::Active: return "active";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

/// @brief Snapshot of one session.
struct SessionInfo
{
    std::string id;
    SessionState state = SessionState::Uninitialized;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point lastActiveAt;
    std::string clientName;
    std::string protocolVersion;
};

/// @brief Owns the sessions of the streaming surface.
///
/// Session ids are random and never reissued: ids of closed sessions are remembered
/// for the lifetime of the manager. Idle sessions are closed by a background sweep,
/// and expiry is also checked on every access.
class SessionManager
{
  public:
    /// @param idleTimeout Inactivity after which a session expires.
    /// @param sweepInterval Period of the background sweep.
    explicit SessionManager(std::chrono::milliseconds idleTimeout,
                            std::chrono::milliseconds sweepInterval = std::chrono::seconds(30));
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// @brief Creates a session in the Initialized state.
    /// @return The new session id, or ShuttingDown after closeAll().
    [[nodiscard]] auto create(std::string clientName, std::string protocolVersion) -> Result<std::string>;

    /// @brief Validates a session id and refreshes its activity timestamp.
    /// @return The session's state, SessionNotInitialized for an id never issued,
    ///         or SessionExpired for a closed or idle session.
    [[nodiscard]] auto touch(std::string_view id) -> Result<SessionState>;

    /// @brief Moves an Initialized session to Active. No effect on other states.
    void markActive(std::string_view id);

    /// @brief Closes a session explicitly.
    /// @return SessionNotInitialized if the id was never issued, SessionExpired if already closed.
    [[nodiscard]] auto close(std::string_view id) -> VoidResult;

    /// @brief Closes every session idle past the timeout.
    /// @return The number of sessions closed.
    auto sweep() -> size_t;

    /// @brief Closes every session and refuses new ones; stops the sweep.
    void closeAll();

    [[nodiscard]] auto info(std::string_view id) const -> std::optional<SessionInfo>;
    [[nodiscard]] auto openCount() const -> size_t;
    [[nodiscard]] auto idleTimeout() const noexcept -> std::chrono::milliseconds { return _idleTimeout; }

  private:
    [[nodiscard]] auto generateId() -> std::string;
    [[nodiscard]] auto isExpired(const SessionInfo& session, std::chrono::steady_clock::time_point now) const
        -> bool;
    void closeLocked(std::map<std::string, SessionInfo, std::less<>>::iterator it);
    void sweepLoop();

    std::chrono::milliseconds _idleTimeout;
    std::chrono::milliseconds _sweepInterval;

    mutable std::mutex _mutex;
    std::map<std::string, SessionInfo, std::less<>> _sessions;
    std::set<std::string, std::less<>> _closedIds;
    std::mt19937_64 _random;
    bool _closed = false;

    std::condition_variable _sweepSignal;
    std::thread _sweeper;
};

} // namespace mcpgate
