// SPDX-License-Identifier: Apache-2.0
#include "PendingResponses.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace netmcp
{

PendingResponses::PendingResponses(std::chrono::milliseconds tick, std::size_t maxAbandoned):
    _tick(std::max(tick, std::chrono::milliseconds(1))), _maxAbandoned(std::max<std::size_t>(maxAbandoned, 1))
{
}

void PendingResponses::expect(int64_t id)
{
    auto const lock = std::lock_guard(_mutex);
    _abandoned.erase(id);
}

auto PendingResponses::deposit(int64_t id, nlohmann::json response) -> bool
{
    {
        auto const lock = std::lock_guard(_mutex);
        if (_abandoned.erase(id) > 0)
        {
            log::debug("Dropping late response for abandoned request {}", id);
            return false;
        }
        _responses.insert_or_assign(id, std::move(response));
    }
    _arrived.notify_all();
    return true;
}

auto PendingResponses::take(int64_t id, std::chrono::milliseconds timeout) -> std::optional<nlohmann::json>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto lock = std::unique_lock(_mutex);

    while (true)
    {
        if (auto it = _responses.find(id); it != _responses.end())
        {
            auto response = std::move(it->second);
            _responses.erase(it);
            return response;
        }

        if (_closed)
            return std::nullopt;

        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            _abandoned.insert(id);
            while (_abandoned.size() > _maxAbandoned)
                _abandoned.erase(_abandoned.begin());
            return std::nullopt;
        }

        _arrived.wait_until(lock, std::min(deadline, now + _tick));
    }
}

auto PendingResponses::sweep() -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    auto dropped = std::size_t { 0 };
    for (auto it = _abandoned.begin(); it != _abandoned.end();)
    {
        if (_responses.erase(*it) > 0)
        {
            ++dropped;
            it = _abandoned.erase(it);
        }
        else
        {
            ++it;
        }
    }
    return dropped;
}

void PendingResponses::close()
{
    {
        auto const lock = std::lock_guard(_mutex);
        _closed = true;
        _abandoned.clear();
    }
    _arrived.notify_all();
}

auto PendingResponses::isClosed() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _closed;
}

auto PendingResponses::size() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _responses.size();
}

auto PendingResponses::contains(int64_t id) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _responses.contains(id);
}

auto PendingResponses::abandonedCount() const -> std::size_t
{
    auto const lock = std::lock_guard(_mutex);
    return _abandoned.size();
}

} // namespace netmcp
