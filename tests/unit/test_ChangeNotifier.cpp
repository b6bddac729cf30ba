#include <catch2/catch_test_macros.hpp>

#include "core/events/ChangeNotifier.hpp"

#include <chrono>
#include <thread>

using namespace signfleet::core;
using namespace std::chrono_literals;

TEST_CASE("ChangeNotifier delivers to every subscriber", "[ChangeNotifier]") {
    ChangeNotifier notifier;
    auto first = notifier.subscribe();
    auto second = notifier.subscribe();

    notifier.publish();

    REQUIRE(first->tryConsume());
    REQUIRE(second->tryConsume());
    REQUIRE_FALSE(first->tryConsume());
}

TEST_CASE("ChangeNotifier coalesces pending signals", "[ChangeNotifier]") {
    ChangeNotifier notifier;
    auto subscription = notifier.subscribe();

    for (int i = 0; i < 100; ++i) {
        notifier.publish();
    }

    REQUIRE(subscription->received() == 100);
    REQUIRE(subscription->tryConsume());
    REQUIRE_FALSE(subscription->tryConsume());
}

TEST_CASE("ChangeNotifier holds subscribers weakly", "[ChangeNotifier]") {
    ChangeNotifier notifier;
    auto kept = notifier.subscribe();
    {
        auto dropped = notifier.subscribe();
        REQUIRE(notifier.subscriberCount() == 2);
    }
    REQUIRE(notifier.subscriberCount() == 1);

    notifier.publish();
    REQUIRE(kept->tryConsume());
}

TEST_CASE("Subscription wait", "[ChangeNotifier]") {
    ChangeNotifier notifier;
    auto subscription = notifier.subscribe();

    SECTION("Times out when nothing is published") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(subscription->wait(50ms));
        REQUIRE(std::chrono::steady_clock::now() - start >= 40ms);
    }

    SECTION("Wakes on a publish from another thread") {
        std::thread publisher([&notifier]() {
            std::this_thread::sleep_for(20ms);
            notifier.publish();
        });
        REQUIRE(subscription->wait(2s));
        publisher.join();
    }

    SECTION("Publishing never waits for an idle subscriber") {
        // Nobody consumes; publish must still return promptly
        auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < 1000; ++i) {
            notifier.publish();
        }
        REQUIRE(std::chrono::steady_clock::now() - start < 1s);
    }
}
