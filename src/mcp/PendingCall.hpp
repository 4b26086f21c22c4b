// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate
{

/// @brief One outstanding request awaiting its correlated response.
struct PendingCall
{
    int64_t id = 0;
    std::string method;
    std::chrono::steady_clock::time_point deadline;

    std::mutex mutex;
    std::condition_variable completed;
    std::optional<Result<nlohmann::json>> outcome;

    /// @brief Stores the outcome and wakes the waiter. Only the first completion wins.
    /// @return True if this call stored the outcome.
    auto complete(Result<nlohmann::json> result) -> bool;

    /// @brief Returns true once an outcome has been stored.
    [[nodiscard]] auto isCompleted() -> bool;
};

/// @brief The pending calls of one backend, keyed by request id.
///
/// Insert and removal are atomic with respect to the reader thread completing calls:
/// whoever removes an entry is the one allowed to complete it.
class PendingCallTable
{
  public:
    /// @brief Registers a call. Fails once the table has been closed.
    [[nodiscard]] auto insert(std::shared_ptr<PendingCall> call) -> VoidResult;

    /// @brief Removes and returns the call with the given id, or nullptr if none is pending.
    [[nodiscard]] auto take(int64_t id) -> std::shared_ptr<PendingCall>;

    /// @brief Removes all calls and refuses further inserts with the given reason.
    [[nodiscard]] auto close(Error reason) -> std::vector<std::shared_ptr<PendingCall>>;

    /// @brief Returns true if a call with this id is pending.
    [[nodiscard]] auto contains(int64_t id) const -> bool;

    /// @brief Returns the number of pending calls.
    [[nodiscard]] auto size() const -> size_t;

  private:
    mutable std::mutex _mutex;
    std::map<int64_t, std::shared_ptr<PendingCall>> _calls;
    std::optional<Error> _closedReason;
};

/// @brief Caller-side handle on a pending call.
///
/// Destroying or cancelling the handle releases the pending slot; the backend may still
/// answer, in which case the late response is discarded.
class CallHandle
{
  public:
    CallHandle() = default;
    CallHandle(std::shared_ptr<PendingCall> call, std::shared_ptr<PendingCallTable> table);
    ~CallHandle();

    CallHandle(CallHandle&&) noexcept = default;
    CallHandle& operator=(CallHandle&& other) noexcept;
    CallHandle(const CallHandle&) = delete;
    CallHandle& operator=(const CallHandle&) = delete;

    /// @brief Returns the request id, or 0 for an empty handle.
    [[nodiscard]] auto requestId() const -> int64_t;

    /// @brief Blocks until the response arrives, the call fails, or its deadline passes.
    /// @return The response result, or BackendUnavailable / CallTimeout / UpstreamError /
    ///         MalformedUpstreamMessage / ShuttingDown / Cancelled.
    [[nodiscard]] auto wait() -> Result<nlohmann::json>;

    /// @brief Stops waiting and releases the pending slot.
    void cancel();

  private:
    std::shared_ptr<PendingCall> _call;
    std::shared_ptr<PendingCallTable> _table;
};

} // namespace mcpgate
