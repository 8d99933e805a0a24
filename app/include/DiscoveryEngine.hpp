/*
 * Battery-aware discovery of local inference servers
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef DISCOVERY_ENGINE_HPP
#define DISCOVERY_ENGINE_HPP

#include "Channel.hpp"
#include "DiscoveredEndpoint.hpp"
#include "EndpointValidator.hpp"
#include "IPowerStateProvider.hpp"
#include "IServiceBrowser.hpp"
#include "PollingPolicy.hpp"
#include "SerialExecutor.hpp"
#include "Settings.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * Externally visible engine state
 */
enum class DiscoveryState {
    Idle,       // No browse running (stopped, or between polls)
    Scanning,   // A browse is active
    Paused,     // App in background, scan not user-initiated
    Failed,     // Last browse failed; the poll loop keeps retrying
};

std::string to_string(DiscoveryState state);

using EndpointSubscription = Broadcaster<EndpointSnapshot>::Subscription;

/**
 * Owns the scan lifecycle and the live endpoint set
 *
 * Every mutation runs on a private SerialExecutor; public methods only
 * queue work onto it and return immediately. This gives one owner for the
 * endpoint set and the per-scan dedup set, so two scans can never race on
 * them.
 *
 * Scan sessions are numbered. Browse events and validation results carry
 * the number of the session that produced them and are dropped once that
 * session has been superseded or stopped.
 */
class DiscoveryEngine {
public:
    /**
     * Validation probe: true if the endpoint speaks the expected protocol
     */
    using ProbeFunction = std::function<bool(const DiscoveredEndpoint&, const PollingPolicy&)>;

    /**
     * @param power Power state source; the engine subscribes to its notifications
     * @param browser DNS-SD browser
     * @param probe Optional probe for testing; an EndpointValidator otherwise
     * @param settings Service type, thresholds and low-power limits
     */
    DiscoveryEngine(PowerStateProviderPtr power,
                    ServiceBrowserPtr browser,
                    ProbeFunction probe = nullptr,
                    DiscoverySettings settings = DiscoverySettings{});
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * Cancel any running scan, clear the endpoint set, browse, and arm the
     * poll loop. Calling it while scanning restarts cleanly.
     */
    void start_discovery(bool user_initiated = false);

    /**
     * Stop browsing and polling. The last endpoint set stays readable.
     */
    void stop_discovery();

    /**
     * Replay-latest subscription: the current snapshot first, then one
     * snapshot per change. Cancel or drop the channel to unsubscribe.
     */
    EndpointSubscription subscribe();

    /**
     * Latest published snapshot
     */
    EndpointSnapshot endpoints() const;

    // Lifecycle reactions; also triggered by the power provider's notifications
    void handle_entered_background();
    void handle_entered_foreground();
    void handle_low_power_mode_changed();

    /**
     * Policy for the current power readings and scan origin
     */
    PollingPolicy current_policy() const;

    DiscoveryState state() const;
    std::string last_error() const;
    bool is_scanning() const { return state() == DiscoveryState::Scanning; }
    std::uint64_t scan_generation() const { return generation_.load(); }
    std::optional<std::chrono::steady_clock::time_point> last_poll_time() const;

    /**
     * Block until queued work and in-flight validations have settled
     */
    void wait_idle();

private:
    struct ScanSession {
        std::uint64_t generation{0};
        std::unordered_set<std::string> processed;
        bool browse_active{false};
        SerialExecutor::TimerId browse_timer{0};
    };

    // All of the following run on executor_
    void do_start(bool user_initiated);
    void do_stop();
    void perform_scan(bool is_polling);
    void end_session();
    void stop_current_browse();
    void schedule_poll();
    void cancel_poll_timer();
    void on_poll_tick();
    bool should_perform_poll() const;
    void handle_browse_event(std::uint64_t generation, const BrowseEvent& event);
    void handle_browse_failure(std::uint64_t generation, const std::string& error);
    void dispatch_validation(DiscoveredEndpoint endpoint, const PollingPolicy& policy,
                             std::uint64_t generation);
    void on_validation_result(std::uint64_t generation, DiscoveredEndpoint endpoint, bool valid);
    void remove_endpoint(const std::string& key);
    void publish_snapshot();
    void reap_validations();
    void pause_if_possible();
    void resume_if_needed();
    void adjust_for_power_mode();

    void on_power_event(PowerEvent event);
    void set_state(DiscoveryState state, const std::string& error = {});
    void run_sync(std::function<void()> task);

    PowerStateProviderPtr power_;
    ServiceBrowserPtr browser_;
    ProbeFunction probe_;
    DiscoverySettings settings_;
    IPowerStateProvider::ListenerId power_listener_{0};

    // Owned by executor_
    std::vector<DiscoveredEndpoint> endpoints_;
    std::optional<ScanSession> session_;
    std::vector<std::shared_future<void>> pending_validations_;
    SerialExecutor::TimerId poll_timer_{0};
    bool poll_loop_active_{false};
    bool paused_{false};
    bool shutting_down_{false};

    Broadcaster<EndpointSnapshot> broadcaster_;
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<bool> user_initiated_{false};

    mutable std::mutex status_mutex_;
    DiscoveryState state_{DiscoveryState::Idle};
    std::string last_error_;
    std::optional<std::chrono::steady_clock::time_point> last_poll_time_;

    // Declared last: destroyed first, after the destructor has stopped it
    SerialExecutor executor_;
};

#endif // DISCOVERY_ENGINE_HPP
