// SPDX-License-Identifier: Apache-2.0
#include <gateway/SessionManager.hpp>

#include <tests/MockTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <set>
#include <thread>

using namespace mcpgate;
using namespace std::chrono_literals;

TEST_CASE("SessionManager creates initialized sessions with random ids", "[sessions]")
{
    auto sessions = SessionManager(10min);

    auto first = sessions.create("client", "2025-06-18");
    auto second = sessions.create("client", "2025-06-18");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first != *second);
    CHECK(first->size() == 64);
    CHECK(first->find_first_not_of("0123456789abcdef") == std::string::npos);

    auto const info = sessions.info(*first);
    REQUIRE(info.has_value());
    CHECK(info->state == SessionState::Initialized);
    CHECK(info->clientName == "client");
    CHECK(info->protocolVersion == "2025-06-18");
    CHECK(sessions.openCount() == 2);
}

TEST_CASE("SessionManager touch validates the session", "[sessions]")
{
    auto sessions = SessionManager(10min);
    auto id = sessions.create("client", "2025-06-18");
    REQUIRE(id.has_value());

    auto state = sessions.touch(*id);
    REQUIRE(state.has_value());
    CHECK(*state == SessionState::Initialized);

    auto unknown = sessions.touch("not-a-session");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::SessionNotInitialized);
}

TEST_CASE("SessionManager markActive only advances initialized sessions", "[sessions]")
{
    auto sessions = SessionManager(10min);
    auto id = sessions.create("client", "2025-06-18");
    REQUIRE(id.has_value());

    sessions.markActive(*id);
    CHECK(sessions.info(*id)->state == SessionState::Active);

    sessions.markActive(*id);
    CHECK(sessions.info(*id)->state == SessionState::Active);

    REQUIRE(sessions.close(*id).has_value());
    sessions.markActive(*id);
    CHECK(sessions.info(*id)->state == SessionState::Closed);
}

TEST_CASE("SessionManager close is final", "[sessions]")
{
    auto sessions = SessionManager(10min);
    auto id = sessions.create("client", "2025-06-18");
    REQUIRE(id.has_value());

    REQUIRE(sessions.close(*id).has_value());
    CHECK(sessions.openCount() == 0);

    auto touched = sessions.touch(*id);
    REQUIRE(!touched.has_value());
    CHECK(touched.error().code == ErrorCode::SessionExpired);

    auto closedAgain = sessions.close(*id);
    REQUIRE(!closedAgain.has_value());
    CHECK(closedAgain.error().code == ErrorCode::SessionExpired);

    auto neverIssued = sessions.close("0123");
    REQUIRE(!neverIssued.has_value());
    CHECK(neverIssued.error().code == ErrorCode::SessionNotInitialized);
}

TEST_CASE("SessionManager expires idle sessions on access", "[sessions]")
{
    auto sessions = SessionManager(100ms, 1h);
    auto id = sessions.create("client", "2025-06-18");
    REQUIRE(id.has_value());

    std::this_thread::sleep_for(150ms);

    auto touched = sessions.touch(*id);
    REQUIRE(!touched.has_value());
    CHECK(touched.error().code == ErrorCode::SessionExpired);
    CHECK(sessions.info(*id)->state == SessionState::Closed);
}

TEST_CASE("SessionManager touch keeps an active session alive", "[sessions]")
{
    auto sessions = SessionManager(300ms, 1h);
    auto id = sessions.create("client", "2025-06-18");
    REQUIRE(id.has_value());

    for (auto i = 0; i < 5; ++i)
    {
        std::this_thread::sleep_for(100ms);
        REQUIRE(sessions.touch(*id).has_value());
    }
}

TEST_CASE("SessionManager sweep closes idle sessions", "[sessions]")
{
    auto sessions = SessionManager(100ms, 1h);
    auto idle = sessions.create("idle", "2025-06-18");
    REQUIRE(idle.has_value());

    std::this_thread::sleep_for(150ms);
    auto fresh = sessions.create("fresh", "2025-06-18");
    REQUIRE(fresh.has_value());

    CHECK(sessions.sweep() == 1);
    CHECK(sessions.openCount() == 1);
    CHECK(sessions.info(*idle)->state == SessionState::Closed);
    CHECK(sessions.info(*fresh)->state == SessionState::Initialized);
}

TEST_CASE("SessionManager background sweep runs periodically", "[sessions]")
{
    auto sessions = SessionManager(50ms, 50ms);
    REQUIRE(sessions.create("client", "2025-06-18").has_value());

    CHECK(test::eventually([&] { return sessions.openCount() == 0; }));
}

TEST_CASE("SessionManager never reissues a closed id", "[sessions]")
{
    auto sessions = SessionManager(10min);
    auto closed = std::set<std::string> {};
    for (auto i = 0; i < 100; ++i)
    {
        auto id = sessions.create("client", "2025-06-18");
        REQUIRE(id.has_value());
        CHECK(!closed.contains(*id));
        REQUIRE(sessions.close(*id).has_value());
        closed.insert(*id);
    }
    CHECK(closed.size() == 100);
}

TEST_CASE("SessionManager closeAll refuses new sessions", "[sessions]")
{
    auto sessions = SessionManager(10min);
    auto id = sessions.create("client", "2025-06-18");
    REQUIRE(id.has_value());

    sessions.closeAll();
    CHECK(sessions.openCount() == 0);

    auto touched = sessions.touch(*id);
    REQUIRE(!touched.has_value());
    CHECK(touched.error().code == ErrorCode::SessionExpired);

    auto created = sessions.create("late", "2025-06-18");
    REQUIRE(!created.has_value());
    CHECK(created.error().code == ErrorCode::ShuttingDown);
}
