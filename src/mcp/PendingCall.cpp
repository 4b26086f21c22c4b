// SPDX-License-Identifier: Apache-2.0
#include "PendingCall.hpp"

#include <format>

namespace mcpgate
{

auto PendingCall::complete(Result<nlohmann::json> result) -> bool
{
    {
        auto const lock = std::lock_guard { mutex };
        if (outcome)
            return false;
        outcome = std::move(result);
    }
    completed.notify_all();
    return true;
}

auto PendingCall::isCompleted() -> bool
{
    auto const lock = std::lock_guard { mutex };
    return outcome.has_value();
}

auto PendingCallTable::insert(std::shared_ptr<PendingCall> call) -> VoidResult
{
    auto const lock = std::lock_guard { _mutex };
    if (_closedReason)
        return std::unexpected(*_closedReason);

    auto const [it, inserted] = _calls.try_emplace(call->id, call);
    if (!inserted)
        return makeError(ErrorCode::InvalidRequest, std::format("Request id {} is already pending", call->id));
    return {};
}

auto PendingCallTable::take(int64_t id) -> std::shared_ptr<PendingCall>
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _calls.find(id);
    if (it == _calls.end())
        return nullptr;

    auto call = std::move(it->second);
    _calls.erase(it);
    return call;
}

auto PendingCallTable::close(Error reason) -> std::vector<std::shared_ptr<PendingCall>>
{
    auto const lock = std::lock_guard { _mutex };
    if (!_closedReason)
        _closedReason = std::move(reason);

    auto calls = std::vector<std::shared_ptr<PendingCall>> {};
    calls.reserve(_calls.size());
    for (auto& [id, call]: _calls)
        calls.push_back(std::move(call));
    _calls.clear();
    return calls;
}

auto PendingCallTable::contains(int64_t id) const -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return _calls.contains(id);
}

auto PendingCallTable::size() const -> size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _calls.size();
}

CallHandle::CallHandle(std::shared_ptr<PendingCall> call, std::shared_ptr<PendingCallTable> table):
    _call(std::move(call)), _table(std::move(table))
{
}

CallHandle::~CallHandle()
{
    cancel();
}

CallHandle& CallHandle::operator=(CallHandle&& other) noexcept
{
    if (this != &other)
    {
        cancel();
        _call = std::move(other._call);
        _table = std::move(other._table);
    }
    return *this;
}

auto CallHandle::requestId() const -> int64_t
{
    return _call ? _call->id : 0;
}

auto CallHandle::wait() -> Result<nlohmann::json>
{
    if (!_call)
        return makeError(ErrorCode::Cancelled, "Call handle is empty");

    auto lock = std::unique_lock { _call->mutex };
    if (!_call->completed.wait_until(lock, _call->deadline, [this] { return _call->outcome.has_value(); }))
    {
        lock.unlock();
        if (auto expired = _table->take(_call->id))
        {
            expired->complete(makeError(ErrorCode::CallTimeout,
                                        std::format("Request {} ('{}') timed out", _call->id, _call->method)));
        }
        // Either we stored the timeout or a concurrent completion is about to land.
        lock.lock();
        _call->completed.wait(lock, [this] { return _call->outcome.has_value(); });
    }

    auto result = std::move(*_call->outcome);
    lock.unlock();
    _call.reset();
    _table.reset();
    return result;
}

void CallHandle::cancel()
{
    if (!_call)
        return;

    if (auto call = _table->take(_call->id))
        call->complete(makeError(ErrorCode::Cancelled, std::format("Request {} cancelled", call->id)));

    _call.reset();
    _table.reset();
}

} // namespace mcpgate
