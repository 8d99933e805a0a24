/*
 * Unit tests for the discovery engine
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "DiscoveryEngine.hpp"
#include "PowerStateProviders.hpp"
#include "TestHelpers.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

/**
 * Manual provider with adjustable poll intervals so tests can drive the loop
 */
class TunablePollPowerProvider : public ManualPowerStateProvider {
public:
    TunablePollPowerProvider(std::chrono::milliseconds normal, std::chrono::milliseconds low_power)
        : normal_interval_(normal)
        , low_power_interval_(low_power)
    {}

    std::chrono::milliseconds suggested_polling_interval() const override
    {
        return is_low_power_mode() ? low_power_interval_.load() : normal_interval_.load();
    }

    void set_normal_interval(std::chrono::milliseconds interval) { normal_interval_ = interval; }

private:
    std::atomic<std::chrono::milliseconds> normal_interval_;
    std::atomic<std::chrono::milliseconds> low_power_interval_;
};

struct EngineFixture {
    std::shared_ptr<ManualPowerStateProvider> power = std::make_shared<ManualPowerStateProvider>();
    std::shared_ptr<FakeServiceBrowser> browser = std::make_shared<FakeServiceBrowser>();
    std::atomic<int> probe_count{0};

    // Hosts starting with "bad" fail validation
    DiscoveryEngine::ProbeFunction probe()
    {
        return [this](const DiscoveredEndpoint& endpoint, const PollingPolicy&) {
            ++probe_count;
            return endpoint.host.rfind("bad", 0) != 0;
        };
    }
};

bool has_unique_keys(const EndpointSnapshot& snapshot)
{
    std::set<std::string> keys;
    for (const auto& endpoint : snapshot) {
        if (!keys.insert(endpoint.key()).second) {
            return false;
        }
    }
    return true;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("DiscoveryEngine rejects missing collaborators") {
    auto power = std::make_shared<ManualPowerStateProvider>();
    auto browser = std::make_shared<FakeServiceBrowser>();

    REQUIRE_THROWS_AS(DiscoveryEngine(nullptr, browser), std::invalid_argument);
    REQUIRE_THROWS_AS(DiscoveryEngine(power, nullptr), std::invalid_argument);
}

TEST_CASE("DiscoveryEngine starts idle with an empty endpoint set") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    REQUIRE(engine.state() == DiscoveryState::Idle);
    REQUIRE(engine.endpoints().empty());
    REQUIRE_FALSE(engine.last_poll_time().has_value());
}

// =============================================================================
// Browse events and validation
// =============================================================================

TEST_CASE("DiscoveryEngine publishes only validated endpoints, once per key") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();

    REQUIRE(engine.state() == DiscoveryState::Scanning);
    REQUIRE(f.browser->last_service_type() == "_http._tcp");

    REQUIRE(f.browser->emit_added("Studio", "studio.local.", 11434));
    REQUIRE(f.browser->emit_added("Printer", "bad-printer.local.", 80));
    REQUIRE(f.browser->emit_added("Studio (2)", "studio.local.", 11434));
    engine.wait_idle();

    const auto endpoints = engine.endpoints();
    REQUIRE(endpoints.size() == 1);
    REQUIRE(endpoints[0].key() == "studio.local.:11434");
    REQUIRE(endpoints[0].name == "Studio");
    REQUIRE(endpoints[0].validated);
    REQUIRE(f.probe_count == 2);
}

TEST_CASE("DiscoveryEngine never holds duplicate keys under mixed add/remove traffic") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());
    auto subscription = engine.subscribe();

    engine.start_discovery();
    engine.wait_idle();

    for (int round = 0; round < 3; ++round) {
        f.browser->emit_added("a", "alpha", 11434);
        f.browser->emit_added("b", "beta", 11434);
        f.browser->emit_added("x", "bad-host", 11434);
        f.browser->emit_added("a", "alpha", 11434);
        f.browser->emit_removed("b", "beta", 11434);
        f.browser->emit_added("b", "beta", 11434);
        engine.wait_idle();
    }

    while (auto snapshot = subscription->try_next()) {
        REQUIRE(has_unique_keys(*snapshot));
        for (const auto& endpoint : *snapshot) {
            REQUIRE(endpoint.host.rfind("bad", 0) != 0);
        }
    }

    const auto endpoints = engine.endpoints();
    REQUIRE(endpoints.size() == 2);
    REQUIRE(has_unique_keys(endpoints));
}

TEST_CASE("Removing an endpoint restores the previous set and allows revalidation") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();

    f.browser->emit_added("a", "alpha", 11434);
    engine.wait_idle();
    const auto before = engine.endpoints();
    REQUIRE(before.size() == 1);

    f.browser->emit_added("b", "beta", 8080);
    engine.wait_idle();
    REQUIRE(engine.endpoints().size() == 2);

    f.browser->emit_removed("b", "beta", 8080);
    engine.wait_idle();
    REQUIRE(engine.endpoints() == before);

    f.browser->emit_added("b", "beta", 8080);
    engine.wait_idle();
    REQUIRE(engine.endpoints().size() == 2);
    REQUIRE(f.probe_count == 3);
}

TEST_CASE("Removing an unknown endpoint publishes nothing") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();

    auto subscription = engine.subscribe();
    REQUIRE(subscription->try_next().has_value());   // Replayed latest

    f.browser->emit_removed("ghost", "ghost", 1);
    engine.wait_idle();
    REQUIRE_FALSE(subscription->try_next().has_value());
}

// =============================================================================
// Subscriptions
// =============================================================================

TEST_CASE("Subscribers get the latest snapshot first and updates independently") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();
    f.browser->emit_added("a", "alpha", 11434);
    engine.wait_idle();

    auto first = engine.subscribe();
    auto second = engine.subscribe();

    auto replay = first->try_next();
    REQUIRE(replay.has_value());
    REQUIRE(replay->size() == 1);
    REQUIRE(second->try_next()->size() == 1);

    first->cancel();

    f.browser->emit_added("b", "beta", 11434);
    engine.wait_idle();

    auto update = second->next_for(std::chrono::seconds(1));
    REQUIRE(update.has_value());
    REQUIRE(update->size() == 2);
    REQUIRE_FALSE(first->try_next().has_value());
    REQUIRE(engine.state() == DiscoveryState::Scanning);
}

// =============================================================================
// Scan lifecycle
// =============================================================================

TEST_CASE("stop_discovery keeps the endpoint set and stops further validation") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();
    f.browser->emit_added("a", "alpha", 11434);
    engine.wait_idle();

    engine.stop_discovery();
    engine.wait_idle();

    REQUIRE(engine.state() == DiscoveryState::Idle);
    REQUIRE_FALSE(f.browser->is_browsing());
    REQUIRE(engine.endpoints().size() == 1);

    REQUIRE_FALSE(f.browser->emit_added("b", "beta", 11434));
    engine.wait_idle();
    REQUIRE(f.probe_count == 1);
    REQUIRE(engine.endpoints().size() == 1);
}

TEST_CASE("start_discovery while scanning restarts cleanly") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();
    f.browser->emit_added("a", "alpha", 11434);
    engine.wait_idle();
    REQUIRE(engine.scan_generation() == 1);

    engine.start_discovery(true);
    engine.wait_idle();

    REQUIRE(engine.scan_generation() == 2);
    REQUIRE(f.browser->start_count() == 2);
    REQUIRE(f.browser->stop_count() == 1);
    REQUIRE(engine.endpoints().empty());
    REQUIRE(engine.state() == DiscoveryState::Scanning);
}

TEST_CASE("Validation results from a superseded scan are discarded") {
    EngineFixture f;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> probe_started{false};

    DiscoveryEngine engine(f.power, f.browser,
        [&](const DiscoveredEndpoint&, const PollingPolicy&) {
            probe_started = true;
            released.wait();
            return true;
        });

    engine.start_discovery();
    engine.wait_idle();

    f.browser->emit_added("slow", "slow-host", 11434);
    REQUIRE(wait_until([&] { return probe_started.load(); }));

    engine.start_discovery();
    REQUIRE(wait_until([&] { return engine.scan_generation() == 2; }));

    release.set_value();
    engine.wait_idle();

    REQUIRE(engine.endpoints().empty());
}

TEST_CASE("Browse start failure surfaces as the Failed state") {
    EngineFixture f;
    f.browser->set_start_succeeds(false);
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();

    REQUIRE(engine.state() == DiscoveryState::Failed);
    REQUIRE_FALSE(engine.last_error().empty());
}

TEST_CASE("Browse failure sets Failed and a later scan clears it") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();

    REQUIRE(f.browser->emit_failure("daemon not running"));
    engine.wait_idle();

    REQUIRE(engine.state() == DiscoveryState::Failed);
    REQUIRE(engine.last_error() == "daemon not running");
    REQUIRE_FALSE(f.browser->is_browsing());

    engine.start_discovery();
    engine.wait_idle();

    REQUIRE(engine.state() == DiscoveryState::Scanning);
    REQUIRE(engine.last_error().empty());
}

// =============================================================================
// Power awareness
// =============================================================================

TEST_CASE("Low power mode stops validating once three endpoints are confirmed") {
    EngineFixture f;
    f.power->set_low_power_mode(true);
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();

    for (int i = 1; i <= 3; ++i) {
        f.browser->emit_added("node", "node" + std::to_string(i), 11434);
        engine.wait_idle();
    }
    REQUIRE(engine.endpoints().size() == 3);
    REQUIRE(f.probe_count == 3);

    f.browser->emit_added("node", "node4", 11434);
    f.browser->emit_added("node", "node5", 11434);
    engine.wait_idle();

    REQUIRE(f.probe_count == 3);
    REQUIRE(engine.endpoints().size() == 3);
}

TEST_CASE("User-initiated scans are not capped in low power mode") {
    EngineFixture f;
    f.power->set_low_power_mode(true);
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery(true);
    engine.wait_idle();

    for (int i = 1; i <= 5; ++i) {
        f.browser->emit_added("node", "node" + std::to_string(i), 11434);
        engine.wait_idle();
    }
    REQUIRE(f.probe_count == 5);
    REQUIRE(engine.endpoints().size() == 5);
}

TEST_CASE("Entering the background pauses a scan that was not user-initiated") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();
    REQUIRE(f.browser->is_browsing());

    f.power->set_in_background(true);
    engine.wait_idle();

    REQUIRE(engine.state() == DiscoveryState::Paused);
    REQUIRE_FALSE(f.browser->is_browsing());
    REQUIRE_FALSE(engine.current_policy().polling_enabled);

    SECTION("foreground with an empty set rescans") {
        f.power->set_in_background(false);
        engine.wait_idle();

        REQUIRE(f.browser->start_count() == 2);
        REQUIRE(engine.state() == DiscoveryState::Scanning);
    }
}

TEST_CASE("Foreground with a fresh endpoint set does not rescan") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();
    f.browser->emit_added("a", "alpha", 11434);
    engine.wait_idle();

    engine.handle_entered_background();
    engine.wait_idle();
    engine.handle_entered_foreground();
    engine.wait_idle();

    REQUIRE(f.browser->start_count() == 1);
    REQUIRE(engine.state() == DiscoveryState::Idle);
    REQUIRE(engine.endpoints().size() == 1);
}

TEST_CASE("Foreground rescans when the last poll is stale") {
    EngineFixture f;
    DiscoverySettings settings;
    settings.staleness = std::chrono::seconds(0);
    DiscoveryEngine engine(f.power, f.browser, f.probe(), settings);

    engine.start_discovery();
    engine.wait_idle();
    f.browser->emit_added("a", "alpha", 11434);
    engine.wait_idle();

    engine.handle_entered_background();
    engine.wait_idle();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    engine.handle_entered_foreground();
    engine.wait_idle();

    REQUIRE(f.browser->start_count() == 2);
    REQUIRE(engine.endpoints().empty());
}

TEST_CASE("User-initiated scans keep running in the background") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery(true);
    engine.wait_idle();

    f.power->set_in_background(true);
    engine.wait_idle();

    REQUIRE(engine.state() == DiscoveryState::Scanning);
    REQUIRE(f.browser->is_browsing());
    REQUIRE(engine.current_policy().polling_enabled);
}

TEST_CASE("Validation finishing after a pause is still accepted") {
    EngineFixture f;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> probe_started{false};

    DiscoveryEngine engine(f.power, f.browser,
        [&](const DiscoveredEndpoint&, const PollingPolicy&) {
            probe_started = true;
            released.wait();
            return true;
        });

    engine.start_discovery();
    engine.wait_idle();
    f.browser->emit_added("slow", "slow-host", 11434);
    REQUIRE(wait_until([&] { return probe_started.load(); }));

    f.power->set_in_background(true);
    REQUIRE(wait_until([&] { return engine.state() == DiscoveryState::Paused; }));

    release.set_value();
    engine.wait_idle();

    REQUIRE(engine.endpoints().size() == 1);
}

TEST_CASE("Low power mode changes are reflected in the current policy") {
    EngineFixture f;
    DiscoveryEngine engine(f.power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();
    REQUIRE(engine.current_policy().probe_timeout == std::chrono::milliseconds(5000));
    REQUIRE_FALSE(engine.current_policy().validation_budget.has_value());

    f.power->set_low_power_mode(true);
    engine.wait_idle();

    const auto policy = engine.current_policy();
    REQUIRE(policy.probe_timeout == std::chrono::milliseconds(1500));
    REQUIRE(policy.interval == std::chrono::seconds(30));
    REQUIRE(policy.validation_budget == std::optional<std::size_t>(3));
    REQUIRE(policy.cache_policy == CachePolicy::PreferCache);

    f.power->set_low_power_mode(false);
    engine.wait_idle();
    REQUIRE(engine.current_policy().probe_timeout == std::chrono::milliseconds(5000));
}

// =============================================================================
// Poll loop
// =============================================================================

TEST_CASE("Poll ticks rescan without clearing the endpoint set") {
    auto power = std::make_shared<TunablePollPowerProvider>(1h, 1h);
    EngineFixture f;
    DiscoveryEngine engine(power, f.browser, f.probe());

    engine.start_discovery();
    engine.wait_idle();
    REQUIRE(f.browser->emit_added("a", "alpha", 11434));
    engine.wait_idle();
    REQUIRE(engine.endpoints().size() == 1);
    REQUIRE(f.probe_count == 1);

    power->set_normal_interval(30ms);
    engine.handle_low_power_mode_changed();
    REQUIRE(wait_until([&] { return f.browser->start_count() >= 2; }));

    // Quiet the loop so the next browse event lands in a stable scan
    power->set_normal_interval(1h);
    engine.handle_low_power_mode_changed();
    engine.wait_idle();

    REQUIRE(engine.endpoints().size() == 1);
    REQUIRE(engine.state() == DiscoveryState::Scanning);

    // The new scan has its own processed set, so the known service is probed again
    REQUIRE(f.browser->emit_added("a", "alpha", 11434));
    engine.wait_idle();
    REQUIRE(f.probe_count == 2);
    REQUIRE(engine.endpoints().size() == 1);
}

TEST_CASE("Low power ticks inside the minimum poll gap are skipped") {
    auto power = std::make_shared<TunablePollPowerProvider>(30ms, 30ms);
    power->set_low_power_mode(true);
    EngineFixture f;

    SECTION("gap not yet elapsed") {
        DiscoverySettings settings;
        settings.low_power_min_poll_gap = 1h;
        DiscoveryEngine engine(power, f.browser, f.probe(), settings);

        engine.start_discovery();
        engine.wait_idle();
        std::this_thread::sleep_for(300ms);

        REQUIRE(f.browser->start_count() == 1);
    }

    SECTION("gap elapsed") {
        DiscoverySettings settings;
        settings.low_power_min_poll_gap = 0ms;
        DiscoveryEngine engine(power, f.browser, f.probe(), settings);

        engine.start_discovery();
        REQUIRE(wait_until([&] { return f.browser->start_count() >= 3; }));
    }
}

TEST_CASE("Low power browse ends after the browse timeout") {
    auto power = std::make_shared<TunablePollPowerProvider>(1h, 1h);
    power->set_low_power_mode(true);
    EngineFixture f;
    DiscoverySettings settings;
    settings.low_power_browse_timeout = 50ms;
    DiscoveryEngine engine(power, f.browser, f.probe(), settings);

    SECTION("automatic scan") {
        engine.start_discovery();
        engine.wait_idle();
        REQUIRE(f.browser->is_browsing());

        REQUIRE(wait_until([&] { return !f.browser->is_browsing(); }));
        REQUIRE(wait_until([&] { return engine.state() == DiscoveryState::Idle; }));
        REQUIRE(f.browser->start_count() == 1);
    }

    SECTION("user-initiated scan has no browse timeout") {
        engine.start_discovery(true);
        engine.wait_idle();
        std::this_thread::sleep_for(200ms);

        REQUIRE(f.browser->is_browsing());
        REQUIRE(engine.state() == DiscoveryState::Scanning);
    }
}

TEST_CASE("Low power mode changes re-arm the poll timer at the new interval") {
    auto power = std::make_shared<TunablePollPowerProvider>(1h, 30ms);
    EngineFixture f;
    DiscoverySettings settings;
    settings.low_power_min_poll_gap = 0ms;
    DiscoveryEngine engine(power, f.browser, f.probe(), settings);

    engine.start_discovery();
    engine.wait_idle();
    std::this_thread::sleep_for(150ms);
    REQUIRE(f.browser->start_count() == 1);

    power->set_low_power_mode(true);
    REQUIRE(wait_until([&] { return f.browser->start_count() >= 3; }));

    power->set_low_power_mode(false);
    engine.wait_idle();
    std::this_thread::sleep_for(100ms);
    const int settled = f.browser->start_count();

    std::this_thread::sleep_for(200ms);
    REQUIRE(f.browser->start_count() == settled);
}

// =============================================================================
// Teardown
// =============================================================================

TEST_CASE("Destroying the engine while a power notification is in flight is safe") {
    EngineFixture f;
    std::atomic<bool> entered{false};
    std::atomic<int> slow_calls{0};

    // Registered first, so it runs ahead of the engine's listener
    f.power->add_listener([&](PowerEvent) {
        entered = true;
        std::this_thread::sleep_for(200ms);
        ++slow_calls;
    });

    auto engine = std::make_unique<DiscoveryEngine>(f.power, f.browser, f.probe());
    engine->start_discovery();
    engine->wait_idle();

    std::thread notifier([&] { f.power->set_low_power_mode(true); });
    CHECK(wait_until([&] { return entered.load(); }));

    engine.reset();
    notifier.join();

    f.power->set_low_power_mode(false);
    REQUIRE(slow_calls == 2);
    REQUIRE_FALSE(f.browser->is_browsing());
}
