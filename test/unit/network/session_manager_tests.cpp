// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for request/response correlation

#include <catch2/catch_test_macros.hpp>

#include "network/session_manager.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace meshwire::network;
using namespace std::chrono_literals;

TEST_CASE("SessionManager: session creation", "[session_manager]") {
    SessionManager sessions;

    SECTION("Request sessions get distinct non-zero ids") {
        std::set<SessionId> ids;
        for (int i = 0; i < 1000; ++i) {
            auto session = sessions.CreateSession();
            REQUIRE(session.stage() == SessionStage::REQUEST);
            REQUIRE(session.id() != 0);
            ids.insert(session.id());
        }
        REQUIRE(ids.size() == 1000);
    }

    SECTION("Inactive sessions carry id 0") {
        auto session = sessions.CreateInactiveSession();
        REQUIRE(session.stage() == SessionStage::INACTIVE);
        REQUIRE(session.id() == 0);
    }
}

TEST_CASE("SessionManager: register pending", "[session_manager]") {
    SessionManager sessions;
    auto session = sessions.CreateSession();

    auto slot = sessions.RegisterPending(session, "PONG");
    REQUIRE(slot);
    CHECK(slot->session_id() == session.id());
    CHECK(slot->expected_type() == "PONG");
    CHECK(slot->stage() == SessionStage::REQUEST);
    CHECK_FALSE(slot->is_resolved());
    CHECK(sessions.HasPending(session.id()));
    CHECK(sessions.PendingCount() == 1);

    SECTION("Same id twice is rejected") {
        REQUIRE_THROWS_AS(sessions.RegisterPending(session), InvalidSessionStateError);
    }

    SECTION("Only REQUEST sessions can wait") {
        REQUIRE_THROWS_AS(sessions.RegisterPending(sessions.CreateInactiveSession()), InvalidSessionStateError);
        REQUIRE_THROWS_AS(sessions.RegisterPending(Session(3, SessionStage::RESPONSE)), InvalidSessionStateError);
    }
}

TEST_CASE("SessionManager: resolve then await", "[session_manager]") {
    SessionManager sessions;
    auto session = sessions.CreateSession();
    auto slot = sessions.RegisterPending(session);

    REQUIRE(sessions.Resolve(session.id(), {'o', 'k'}));
    CHECK(slot->is_resolved());
    CHECK(slot->stage() == SessionStage::RESPONSE);

    SECTION("At most one resolution") {
        REQUIRE_FALSE(sessions.Resolve(session.id(), {'n', 'o'}));
        CHECK(slot->payload() == std::vector<uint8_t>{'o', 'k'});
    }

    auto payload = sessions.AwaitResponse(session.id(), 1s);
    CHECK(payload == std::vector<uint8_t>{'o', 'k'});
    CHECK(slot->stage() == SessionStage::CONSUMED);
    CHECK_FALSE(sessions.HasPending(session.id()));

    // Consumed: a late duplicate is dropped
    CHECK_FALSE(sessions.Resolve(session.id(), {'l', 'a', 't', 'e'}));
}

TEST_CASE("SessionManager: unknown sessions", "[session_manager]") {
    SessionManager sessions;
    CHECK_FALSE(sessions.Resolve(12345, {}));
    CHECK_THROWS_AS(sessions.AwaitResponse(12345, 10ms), UnknownSessionError);
    CHECK_FALSE(sessions.Remove(12345));
}

TEST_CASE("SessionManager: timeout evicts the slot", "[session_manager]") {
    SessionManager sessions;
    auto session = sessions.CreateSession();
    sessions.RegisterPending(session);

    auto start = std::chrono::steady_clock::now();
    try {
        sessions.AwaitResponse(session.id(), 50ms);
        FAIL("expected ResponseTimeoutError");
    } catch (const ResponseTimeoutError& e) {
        CHECK(e.session_id() == session.id());
    }
    CHECK(std::chrono::steady_clock::now() - start >= 50ms);
    CHECK_FALSE(sessions.HasPending(session.id()));
    CHECK(sessions.PendingCount() == 0);

    // Response racing the eviction is dropped, not resurrected
    CHECK_FALSE(sessions.Resolve(session.id(), {'x'}));
    CHECK_FALSE(sessions.HasPending(session.id()));
}

TEST_CASE("SessionManager: waiter wakes as soon as it is resolved", "[session_manager][threading]") {
    SessionManager sessions;
    auto session = sessions.CreateSession();
    sessions.RegisterPending(session);

    std::thread resolver([&]() {
        std::this_thread::sleep_for(20ms);
        sessions.Resolve(session.id(), {'h', 'i'});
    });

    auto start = std::chrono::steady_clock::now();
    auto payload = sessions.AwaitResponse(session.id(), 10s);
    auto waited = std::chrono::steady_clock::now() - start;
    resolver.join();

    CHECK(payload == std::vector<uint8_t>{'h', 'i'});
    CHECK(waited < 5s);
}

TEST_CASE("SessionManager: unbounded timeouts are clamped", "[session_manager][threading]") {
    SessionManager sessions;

    SECTION("Already resolved") {
        auto session = sessions.CreateSession();
        sessions.RegisterPending(session);
        REQUIRE(sessions.Resolve(session.id(), {'o', 'k'}));
        CHECK(sessions.AwaitResponse(session.id(), std::chrono::milliseconds::max()) ==
              std::vector<uint8_t>{'o', 'k'});
    }

    SECTION("Resolved while waiting") {
        auto session = sessions.CreateSession();
        sessions.RegisterPending(session);
        std::thread resolver([&]() {
            std::this_thread::sleep_for(20ms);
            sessions.Resolve(session.id(), {'l', 'a', 't', 'e'});
        });
        auto payload = sessions.AwaitResponse(session.id(), std::chrono::milliseconds::max());
        resolver.join();
        CHECK(payload == std::vector<uint8_t>{'l', 'a', 't', 'e'});
    }

    CHECK(sessions.PendingCount() == 0);
}

TEST_CASE("SessionManager: many concurrent waiters resolve independently", "[session_manager][threading]") {
    SessionManager sessions;
    constexpr int N = 32;

    std::vector<Session> created;
    for (int i = 0; i < N; ++i) {
        created.push_back(sessions.CreateSession());
        sessions.RegisterPending(created.back());
    }

    std::atomic<int> correct{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < N; ++i) {
        waiters.emplace_back([&, i]() {
            auto payload = sessions.AwaitResponse(created[i].id(), 10s);
            if (payload == std::vector<uint8_t>{static_cast<uint8_t>(i)}) {
                ++correct;
            }
        });
    }

    // Resolve in reverse order
    for (int i = N - 1; i >= 0; --i) {
        REQUIRE(sessions.Resolve(created[i].id(), {static_cast<uint8_t>(i)}));
    }
    for (auto& t : waiters) {
        t.join();
    }

    CHECK(correct == N);
    CHECK(sessions.PendingCount() == 0);
}

TEST_CASE("SessionManager: Remove drops a slot without waiting", "[session_manager]") {
    SessionManager sessions;
    auto session = sessions.CreateSession();
    sessions.RegisterPending(session);
    CHECK(sessions.Remove(session.id()));
    CHECK_FALSE(sessions.HasPending(session.id()));
    CHECK_THROWS_AS(sessions.AwaitResponse(session.id(), 10ms), UnknownSessionError);
}
