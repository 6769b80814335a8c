#include <catch2/catch.hpp>
#include "result_coordinator.hpp"
#include "oauth2_errors.hpp"
#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace oauth2_loopback;
using namespace std::chrono_literals;

TEST_CASE("ResultCoordinator first result wins", "[result_coordinator]") {
    ResultCoordinator coordinator;
    REQUIRE_FALSE(coordinator.IsDecided());

    REQUIRE(coordinator.Publish(CallbackResult::Authorized("first")));
    REQUIRE_FALSE(coordinator.Publish(CallbackResult::Authorized("second")));
    REQUIRE_FALSE(coordinator.Publish(CallbackResult::Denied("access_denied", "")));
    REQUIRE(coordinator.IsDecided());

    auto result = coordinator.Await(CancellationToken::None());
    REQUIRE(result.IsAuthorized());
    REQUIRE(result.code == "first");
}

TEST_CASE("ResultCoordinator wakes a blocked waiter", "[result_coordinator]") {
    ResultCoordinator coordinator;
    CancellationSource source;

    auto waiter = std::async(std::launch::async, [&coordinator, &source]() {
        return coordinator.Await(source.Token());
    });

    REQUIRE(waiter.wait_for(50ms) == std::future_status::timeout);
    REQUIRE(coordinator.Publish(CallbackResult::Denied("access_denied", "nope", "s1")));

    REQUIRE(waiter.wait_for(5s) == std::future_status::ready);
    auto result = waiter.get();
    REQUIRE_FALSE(result.IsAuthorized());
    REQUIRE(result.error_code == "access_denied");
    REQUIRE(result.error_description == "nope");
    REQUIRE(result.state == "s1");
}

TEST_CASE("ResultCoordinator cancellation", "[result_coordinator]") {
    ResultCoordinator coordinator;

    SECTION("Explicit cancel wakes the waiter") {
        CancellationSource source;
        auto waiter = std::async(std::launch::async, [&coordinator, &source]() {
            return coordinator.Await(source.Token());
        });
        REQUIRE(waiter.wait_for(50ms) == std::future_status::timeout);

        source.Cancel();
        REQUIRE(waiter.wait_for(5s) == std::future_status::ready);
        try {
            waiter.get();
            FAIL("Await returned instead of throwing");
        } catch (const Cancelled& e) {
            REQUIRE(e.Reason() == "cancelled");
        }

        // A late result is discarded
        REQUIRE_FALSE(coordinator.Publish(CallbackResult::Authorized("late")));
        REQUIRE_FALSE(coordinator.PeekResult().has_value());
    }

    SECTION("Deadline wakes the waiter") {
        auto source = CancellationSource::WithTimeout(100ms);
        auto start = std::chrono::steady_clock::now();
        try {
            coordinator.Await(source.Token());
            FAIL("Await returned instead of throwing");
        } catch (const Cancelled& e) {
            REQUIRE(e.Reason() == "deadline exceeded");
        }
        REQUIRE(std::chrono::steady_clock::now() - start >= 100ms);
        REQUIRE(coordinator.IsDecided());
    }

    SECTION("Token already cancelled before Await") {
        CancellationSource source;
        source.Cancel();
        REQUIRE_THROWS_AS(coordinator.Await(source.Token()), Cancelled);
    }

    SECTION("Result published before cancellation is kept") {
        CancellationSource source;
        REQUIRE(coordinator.Publish(CallbackResult::Authorized("abc")));
        source.Cancel();
        auto result = coordinator.Await(source.Token());
        REQUIRE(result.code == "abc");
    }
}

TEST_CASE("ResultCoordinator concurrent publishers", "[result_coordinator]") {
    ResultCoordinator coordinator;
    const int num_threads = 16;
    std::atomic<int> winners(0);
    std::atomic<bool> go(false);
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&coordinator, &winners, &go, i]() {
            while (!go) {
                std::this_thread::yield();
            }
            if (coordinator.Publish(CallbackResult::Authorized("code" + std::to_string(i)))) {
                winners++;
            }
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(winners == 1);
    auto result = coordinator.Await(CancellationToken::None());
    REQUIRE(result.code.rfind("code", 0) == 0);
    REQUIRE(coordinator.PeekResult()->code == result.code);
}

TEST_CASE("ResultCoordinator failure wakes the waiter", "[result_coordinator]") {
    ResultCoordinator coordinator;
    CancellationSource source;

    auto waiter = std::async(std::launch::async, [&coordinator, &source]() {
        return coordinator.Await(source.Token());
    });
    REQUIRE(waiter.wait_for(50ms) == std::future_status::timeout);

    REQUIRE(coordinator.Fail("listener gone"));
    REQUIRE(waiter.wait_for(5s) == std::future_status::ready);
    try {
        waiter.get();
        FAIL("expected OAuth2LoopbackError");
    } catch (const Cancelled&) {
        FAIL("a failure is not a cancellation");
    } catch (const OAuth2LoopbackError& e) {
        REQUIRE(std::string(e.what()).find("listener gone") != std::string::npos);
    }

    REQUIRE(coordinator.IsDecided());
    REQUIRE_FALSE(coordinator.Publish(CallbackResult::Authorized("late")));
    REQUIRE_FALSE(coordinator.Fail("again"));
}

TEST_CASE("ResultCoordinator ignores failure after a result", "[result_coordinator]") {
    ResultCoordinator coordinator;
    REQUIRE(coordinator.Publish(CallbackResult::Authorized("kept")));
    REQUIRE_FALSE(coordinator.Fail("listener gone"));
    REQUIRE(coordinator.Await(CancellationToken::None()).code == "kept");
}
