// SPDX-License-Identifier: Apache-2.0
#include "SessionManager.hpp"

#include <core/Log.hpp>

#include <array>
#include <format>

namespace mcpgate
{

namespace
{
    constexpr auto SessionIdBytes = 32;
} // namespace

SessionManager::SessionManager(std::chrono::milliseconds idleTimeout, std::chrono::milliseconds sweepInterval):
    _idleTimeout(idleTimeout), _sweepInterval(sweepInterval), _random(std::random_device {}())
{
    _sweeper = std::thread([this] { sweepLoop(); });
}

SessionManager::~SessionManager()
{
    closeAll();
}

auto SessionManager::create(std::string clientName, std::string protocolVersion) -> Result<std::string>
{
    auto const lock = std::lock_guard { _mutex };
    if (_closed)
        return makeError(ErrorCode::ShuttingDown, "Gateway is shutting down");

    auto id = generateId();
    while (_sessions.contains(id) || _closedIds.contains(id))
        id = generateId();

    auto const now = std::chrono::steady_clock::now();
    _sessions.emplace(id,
                      SessionInfo {
                          .id = id,
                          .state = SessionState::Initialized,
                          .createdAt = now,
                          .lastActiveAt = now,
                          .clientName = std::move(clientName),
                          .protocolVersion = std::move(protocolVersion),
                      });

    log::debug("Session {} created ({} open)", id, _sessions.size());
    return id;
}

auto SessionManager::touch(std::string_view id) -> Result<SessionState>
{
    auto const lock = std::lock_guard { _mutex };

    auto it = _sessions.find(id);
    if (it == _sessions.end())
    {
        if (_closedIds.contains(id))
            return makeError(ErrorCode::SessionExpired, "Session has been closed");
        return makeError(ErrorCode::SessionNotInitialized, "Unknown session; call initialize first");
    }

    auto const now = std::chrono::steady_clock::now();
    if (isExpired(it->second, now))
    {
        closeLocked(it);
        return makeError(ErrorCode::SessionExpired, "Session expired after inactivity");
    }

    it->second.lastActiveAt = now;
    return it->second.state;
}

void SessionManager::markActive(std::string_view id)
{
    auto const lock = std::lock_guard { _mutex };
    if (auto it = _sessions.find(id); it != _sessions.end() && it->second.state == SessionState::Initialized)
        it->second.state = SessionState::Active;
}

auto SessionManager::close(std::string_view id) -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };

    auto it = _sessions.find(id);
    if (it == _sessions.end())
    {
        if (_closedIds.contains(id))
            return makeError(ErrorCode::SessionExpired, "Session has already been closed");
        return makeError(ErrorCode::SessionNotInitialized, "Unknown session");
    }

    closeLocked(it);
    return {};
}

auto SessionManager::sweep() -> size_t
{
    auto const lock = std::lock_guard { _mutex };
    auto const now = std::chrono::steady_clock::now();

    auto count = size_t { 0 };
    for (auto it = _sessions.begin(); it != _sessions.end();)
    {
        auto next = std::next(it);
        if (isExpired(it->second, now))
        {
            closeLocked(it);
            ++count;
        }
        it = next;
    }

    if (count > 0)
        log::info("Closed {} idle session(s)", count);
    return count;
}

void SessionManager::closeAll()
{
    {
        auto const lock = std::lock_guard { _mutex };
        if (!_closed)
        {
            _closed = true;
            if (!_sessions.empty())
                log::info("Closing {} session(s)", _sessions.size());
            while (!_sessions.empty())
                closeLocked(_sessions.begin());
        }
    }
    _sweepSignal.notify_all();

    if (_sweeper.joinable() && _sweeper.get_id() != std::this_thread::get_id())
        _sweeper.join();
}

auto SessionManager::info(std::string_view id) const -> std::optional<SessionInfo>
{
    auto const lock = std::lock_guard { _mutex };
    if (auto it = _sessions.find(id); it != _sessions.end())
        return it->second;
    if (_closedIds.contains(id))
        return SessionInfo { .id = std::string(id), .state = SessionState::Closed };
    return std::nullopt;
}

auto SessionManager::openCount() const -> size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _sessions.size();
}

auto SessionManager::generateId() -> std::string
{
    static constexpr auto HexDigits = std::string_view { "0123456789abcdef" };

    auto bytes = std::array<uint8_t, SessionIdBytes> {};
    for (auto i = size_t { 0 }; i < bytes.size(); i += 8)
    {
        auto const word = _random();
        for (auto j = size_t { 0 }; j < 8; ++j)
            bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
    }

    auto id = std::string {};
    id.reserve(bytes.size() * 2);
    for (auto const byte: bytes)
    {
        id += HexDigits[byte >> 4];
        id += HexDigits[byte & 0x0F];
    }
    return id;
}

auto SessionManager::isExpired(const SessionInfo& session, std::chrono::steady_clock::time_point now) const
    -> bool
{
    return now - session.lastActiveAt >= _idleTimeout;
}

void SessionManager::closeLocked(std::map<std::string, SessionInfo, std::less<>>::iterator it)
{
    log::debug("Session {} closed", it->first);
    _closedIds.insert(it->first);
    _sessions.erase(it);
}

void SessionManager::sweepLoop()
{
    auto lock = std::unique_lock { _mutex };
    while (!_closed)
    {
        _sweepSignal.wait_for(lock, _sweepInterval, [this] { return _closed; });
        if (_closed)
            return;

        lock.unlock();
        sweep();
        lock.lock();
    }
}

} // namespace mcpgate
