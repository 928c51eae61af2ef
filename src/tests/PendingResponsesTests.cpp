// SPDX-License-Identifier: Apache-2.0
#include <mcp/PendingResponses.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

using namespace netmcp;
using namespace std::chrono_literals;

TEST_CASE("PendingResponses hands out a response exactly once", "[pending]")
{
    auto pending = PendingResponses(5ms);

    CHECK(pending.deposit(1, nlohmann::json { { "id", 1 }, { "result", "a" } }));
    CHECK(pending.contains(1));

    auto first = pending.take(1, 50ms);
    REQUIRE(first.has_value());
    CHECK((*first)["result"] == "a");
    CHECK(!pending.contains(1));

    auto second = pending.take(1, 20ms);
    CHECK(!second.has_value());
}

TEST_CASE("PendingResponses matches by id regardless of arrival order", "[pending]")
{
    auto pending = PendingResponses(5ms);

    pending.deposit(3, nlohmann::json { { "id", 3 } });
    pending.deposit(2, nlohmann::json { { "id", 2 } });
    CHECK(pending.size() == 2);

    auto two = pending.take(2, 50ms);
    REQUIRE(two.has_value());
    CHECK((*two)["id"] == 2);

    auto three = pending.take(3, 50ms);
    REQUIRE(three.has_value());
    CHECK((*three)["id"] == 3);
    CHECK(pending.size() == 0);
}

TEST_CASE("PendingResponses wakes a waiter when its response arrives", "[pending]")
{
    auto pending = PendingResponses(50ms);

    auto producer = std::jthread([&] {
        std::this_thread::sleep_for(30ms);
        pending.deposit(9, nlohmann::json { { "id", 9 } });
    });

    auto const before = std::chrono::steady_clock::now();
    auto response = pending.take(9, 2000ms);
    auto const elapsed = std::chrono::steady_clock::now() - before;

    REQUIRE(response.has_value());
    CHECK(elapsed < 1000ms);
}

TEST_CASE("PendingResponses take respects its deadline", "[pending]")
{
    auto const tick = 10ms;
    auto const timeout = 100ms;
    auto pending = PendingResponses(tick);

    auto const before = std::chrono::steady_clock::now();
    auto response = pending.take(4, timeout);
    auto const elapsed = std::chrono::steady_clock::now() - before;

    CHECK(!response.has_value());
    CHECK(elapsed >= timeout);
    CHECK(elapsed <= timeout + tick + 200ms);
}

TEST_CASE("PendingResponses drops late replies to abandoned ids", "[pending]")
{
    auto pending = PendingResponses(5ms);

    REQUIRE(!pending.take(5, 10ms).has_value());

    CHECK(!pending.deposit(5, nlohmann::json { { "id", 5 }, { "result", "late" } }));
    CHECK(!pending.contains(5));
    CHECK(pending.size() == 0);

    // Only the first late reply is swallowed; the id is forgotten afterwards.
    CHECK(pending.deposit(5, nlohmann::json { { "id", 5 } }));
}

TEST_CASE("PendingResponses delivers the reply to a retry with the same id", "[pending]")
{
    auto pending = PendingResponses(5ms);

    REQUIRE(!pending.take(7, 20ms).has_value());
    CHECK(pending.abandonedCount() == 1);

    pending.expect(7);
    CHECK(pending.abandonedCount() == 0);

    CHECK(pending.deposit(7, nlohmann::json { { "id", 7 }, { "result", "retried" } }));
    auto response = pending.take(7, 50ms);
    REQUIRE(response.has_value());
    CHECK((*response)["result"] == "retried");
}

TEST_CASE("PendingResponses bounds the set of abandoned ids", "[pending]")
{
    auto pending = PendingResponses(1ms, 3);

    for (auto id = int64_t { 1 }; id <= 5; ++id)
        REQUIRE(!pending.take(id, 1ms).has_value());

    CHECK(pending.abandonedCount() == 3);

    // The lowest ids were forgotten, so their replies are stored again.
    CHECK(pending.deposit(1, nlohmann::json { { "id", 1 } }));
    CHECK(!pending.deposit(5, nlohmann::json { { "id", 5 } }));

    pending.close();
    CHECK(pending.abandonedCount() == 0);
}

TEST_CASE("PendingResponses sweep leaves live entries alone", "[pending]")
{
    auto pending = PendingResponses(5ms);
    pending.deposit(1, nlohmann::json { { "id", 1 } });

    CHECK(pending.sweep() == 0);
    CHECK(pending.contains(1));
}

TEST_CASE("PendingResponses close wakes waiters", "[pending]")
{
    auto pending = PendingResponses(20ms);

    auto closer = std::jthread([&] {
        std::this_thread::sleep_for(30ms);
        pending.close();
    });

    auto const before = std::chrono::steady_clock::now();
    auto response = pending.take(1, 5000ms);
    auto const elapsed = std::chrono::steady_clock::now() - before;

    CHECK(!response.has_value());
    CHECK(pending.isClosed());
    CHECK(elapsed < 2000ms);
}

TEST_CASE("PendingResponses still returns stored responses after close", "[pending]")
{
    auto pending = PendingResponses(5ms);
    pending.deposit(2, nlohmann::json { { "id", 2 } });
    pending.close();

    CHECK(pending.take(2, 10ms).has_value());
    CHECK(!pending.take(3, 1000ms).has_value());
}
