/*
 * Unit tests for the serial executor, channels and broadcaster
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "Channel.hpp"
#include "SerialExecutor.hpp"
#include "TestHelpers.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// =============================================================================
// SerialExecutor
// =============================================================================

TEST_CASE("SerialExecutor runs tasks in order on its own thread") {
    SerialExecutor executor("test");
    std::vector<int> order;
    std::atomic<bool> on_executor{true};

    for (int i = 0; i < 10; ++i) {
        executor.post([&, i] {
            order.push_back(i);
            if (!executor.is_current_thread()) {
                on_executor = false;
            }
        });
    }
    executor.drain();

    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
    REQUIRE(on_executor);
    REQUIRE_FALSE(executor.is_current_thread());
}

TEST_CASE("SerialExecutor timers fire after their delay and can be cancelled") {
    SerialExecutor executor("timers");
    std::atomic<int> fired{0};
    std::atomic<int> cancelled_fired{0};

    executor.post_after(20ms, [&] { ++fired; });
    const auto id = executor.post_after(20ms, [&] { ++cancelled_fired; });
    REQUIRE(id != 0);
    executor.cancel_timer(id);

    REQUIRE(wait_until([&] { return fired.load() == 1; }));
    std::this_thread::sleep_for(50ms);
    REQUIRE(cancelled_fired == 0);
}

TEST_CASE("SerialExecutor survives a throwing task") {
    SerialExecutor executor("throwing");
    std::atomic<bool> ran_after{false};

    executor.post([] { throw std::runtime_error("boom"); });
    executor.post([&] { ran_after = true; });
    executor.drain();

    REQUIRE(ran_after);
}

TEST_CASE("SerialExecutor rejects work once stopped") {
    SerialExecutor executor("stopped");
    executor.stop();
    executor.stop();

    REQUIRE_FALSE(executor.post([] {}));
    REQUIRE(executor.post_after(1ms, [] {}) == 0);
}

// =============================================================================
// Channel
// =============================================================================

TEST_CASE("Channel delivers pushed values then ends after close") {
    Channel<int> channel;
    REQUIRE(channel.push(1));
    REQUIRE(channel.push(2));
    channel.close();
    REQUIRE_FALSE(channel.push(3));

    REQUIRE(channel.next() == std::optional<int>(1));
    REQUIRE(channel.next() == std::optional<int>(2));
    REQUIRE_FALSE(channel.next().has_value());
    REQUIRE(channel.is_finished());
}

TEST_CASE("Channel next_for times out on an open empty channel") {
    Channel<int> channel;
    REQUIRE_FALSE(channel.next_for(10ms).has_value());
    REQUIRE_FALSE(channel.is_finished());
}

TEST_CASE("Channel cancel drops queued values and runs the hook once") {
    Channel<int> channel;
    int hook_calls = 0;
    channel.set_on_cancel([&hook_calls] { ++hook_calls; });

    channel.push(1);
    channel.cancel();
    channel.cancel();

    REQUIRE(hook_calls == 1);
    REQUIRE(channel.is_cancelled());
    REQUIRE_FALSE(channel.try_next().has_value());
    REQUIRE_FALSE(channel.push(2));
}

TEST_CASE("Channel wakes a blocked consumer") {
    Channel<int> channel;
    std::thread producer([&channel] {
        std::this_thread::sleep_for(10ms);
        channel.push(42);
    });

    REQUIRE(channel.next() == std::optional<int>(42));
    producer.join();
}

// =============================================================================
// Broadcaster
// =============================================================================

TEST_CASE("Broadcaster replays the latest value to new subscribers") {
    Broadcaster<int> broadcaster(0);
    broadcaster.publish(1);
    broadcaster.publish(2);

    auto subscription = broadcaster.subscribe();
    REQUIRE(subscription->try_next() == std::optional<int>(2));
    REQUIRE_FALSE(subscription->try_next().has_value());

    broadcaster.publish(3);
    REQUIRE(subscription->try_next() == std::optional<int>(3));
}

TEST_CASE("Broadcaster subscribers are independent") {
    Broadcaster<int> broadcaster(0);
    auto first = broadcaster.subscribe();
    auto second = broadcaster.subscribe();
    REQUIRE(broadcaster.subscriber_count() == 2);

    first->cancel();
    broadcaster.publish(7);

    REQUIRE(broadcaster.subscriber_count() == 1);
    REQUIRE(second->try_next() == std::optional<int>(0));
    REQUIRE(second->try_next() == std::optional<int>(7));

    {
        auto dropped = broadcaster.subscribe();
    }
    broadcaster.publish(8);
    REQUIRE(broadcaster.subscriber_count() == 1);
}

TEST_CASE("Broadcaster close ends every subscription") {
    Broadcaster<int> broadcaster(5);
    auto subscription = broadcaster.subscribe();
    broadcaster.close();

    REQUIRE(subscription->next() == std::optional<int>(5));
    REQUIRE_FALSE(subscription->next().has_value());

    auto late = broadcaster.subscribe();
    REQUIRE_FALSE(late->next().has_value());
}
