// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>

namespace netmcp
{

/// @brief Table of responses that arrived but have not been consumed yet.
///
/// The reader thread deposits, the waiting caller takes. Each entry is handed
/// out exactly once. Ids whose wait timed out are remembered as abandoned so
/// that their late replies are dropped instead of piling up.
class PendingResponses
{
  public:
    /// @param tick Upper bound on how long a waiter sleeps between checks of
    ///             its deadline and of the closed flag.
    /// @param maxAbandoned Number of abandoned ids remembered at most. Beyond
    ///                     that the lowest ids are forgotten first.
    explicit PendingResponses(std::chrono::milliseconds tick = std::chrono::milliseconds(20),
                              std::size_t maxAbandoned = 1024);

    /// @brief Announces that a request with this id is about to be sent.
    ///
    /// Clears an abandoned mark left by an earlier timeout, so that a retry
    /// reusing the id receives its reply.
    void expect(int64_t id);

    /// @brief Stores a response, overwriting an earlier one with the same id.
    /// @return false if the id was abandoned and the response was dropped.
    auto deposit(int64_t id, nlohmann::json response) -> bool;

    /// @brief Waits for the response with the given id and removes it.
    /// @return The response, or std::nullopt on timeout or once closed.
    ///         On timeout the id is marked abandoned.
    [[nodiscard]] auto take(int64_t id, std::chrono::milliseconds timeout) -> std::optional<nlohmann::json>;

    /// @brief Drops stored responses whose ids were abandoned.
    /// @return The number of dropped entries.
    auto sweep() -> std::size_t;

    /// @brief Wakes all waiters and forgets abandoned ids. Subsequent takes
    ///        return immediately unless the response is already present.
    void close();

    [[nodiscard]] auto isClosed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto contains(int64_t id) const -> bool;
    [[nodiscard]] auto abandonedCount() const -> std::size_t;

  private:
    std::chrono::milliseconds _tick;
    std::size_t _maxAbandoned;
    mutable std::mutex _mutex;
    std::condition_variable _arrived;
    std::map<int64_t, nlohmann::json> _responses;
    std::set<int64_t> _abandoned;
    bool _closed = false;
};

} // namespace netmcp
