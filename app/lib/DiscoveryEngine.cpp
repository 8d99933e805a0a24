/*
 * Discovery engine implementation
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "DiscoveryEngine.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <stdexcept>

std::string to_string(DiscoveryState state)
{
    switch (state) {
        case DiscoveryState::Idle: return "idle";
        case DiscoveryState::Scanning: return "scanning";
        case DiscoveryState::Paused: return "paused";
        case DiscoveryState::Failed: return "failed";
    }
    return "unknown";
}

DiscoveryEngine::DiscoveryEngine(PowerStateProviderPtr power,
                                 ServiceBrowserPtr browser,
                                 ProbeFunction probe,
                                 DiscoverySettings settings)
    : power_(std::move(power))
    , browser_(std::move(browser))
    , probe_(std::move(probe))
    , settings_(std::move(settings))
    , executor_("discovery")
{
    if (!power_ || !browser_) {
        throw std::invalid_argument("DiscoveryEngine requires a power provider and a browser");
    }

    if (!probe_) {
        auto validator = std::make_shared<EndpointValidator>();
        probe_ = [validator](const DiscoveredEndpoint& endpoint, const PollingPolicy& policy) {
            return validator->validate(endpoint, policy);
        };
    }

    power_listener_ = power_->add_listener([this](PowerEvent event) { on_power_event(event); });
}

DiscoveryEngine::~DiscoveryEngine()
{
    power_->remove_listener(power_listener_);

    run_sync([this] {
        shutting_down_ = true;
        cancel_poll_timer();
        end_session();
    });

    // Validations post their results back; let them finish while the
    // executor still accepts work.
    std::vector<std::shared_future<void>> pending;
    run_sync([this, &pending] { pending.swap(pending_validations_); });
    for (auto& validation : pending) {
        validation.wait();
    }

    executor_.stop();
    broadcaster_.close();
}

void DiscoveryEngine::start_discovery(bool user_initiated)
{
    executor_.post([this, user_initiated] { do_start(user_initiated); });
}

void DiscoveryEngine::stop_discovery()
{
    executor_.post([this] { do_stop(); });
}

EndpointSubscription DiscoveryEngine::subscribe()
{
    return broadcaster_.subscribe();
}

EndpointSnapshot DiscoveryEngine::endpoints() const
{
    return broadcaster_.latest();
}

void DiscoveryEngine::handle_entered_background()
{
    executor_.post([this] { pause_if_possible(); });
}

void DiscoveryEngine::handle_entered_foreground()
{
    executor_.post([this] { resume_if_needed(); });
}

void DiscoveryEngine::handle_low_power_mode_changed()
{
    executor_.post([this] { adjust_for_power_mode(); });
}

PollingPolicy DiscoveryEngine::current_policy() const
{
    PollingPolicy policy = compute_polling_policy(power_->snapshot(), user_initiated_.load(), settings_);
    policy.interval = power_->suggested_polling_interval();
    return policy;
}

DiscoveryState DiscoveryEngine::state() const
{
    std::lock_guard<std::mutex> lock(status_mutex_);
    return state_;
}

std::string DiscoveryEngine::last_error() const
{
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_error_;
}

std::optional<std::chrono::steady_clock::time_point> DiscoveryEngine::last_poll_time() const
{
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_poll_time_;
}

void DiscoveryEngine::wait_idle()
{
    for (;;) {
        std::vector<std::shared_future<void>> pending;
        run_sync([this, &pending] {
            reap_validations();
            pending = pending_validations_;
        });
        if (pending.empty()) {
            return;
        }
        for (auto& validation : pending) {
            validation.wait();
        }
    }
}

void DiscoveryEngine::do_start(bool user_initiated)
{
    if (shutting_down_) {
        return;
    }

    user_initiated_ = user_initiated;
    cancel_poll_timer();
    paused_ = false;

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->info("Starting discovery (user initiated: {}, power mode: {})",
                     user_initiated, to_string(power_->power_mode()));
    }

    perform_scan(false);

    poll_loop_active_ = true;
    schedule_poll();
}

void DiscoveryEngine::do_stop()
{
    end_session();
    cancel_poll_timer();
    poll_loop_active_ = false;
    paused_ = false;
    set_state(DiscoveryState::Idle);

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->info("Stopped discovery with {} endpoint(s) known", endpoints_.size());
    }
}

void DiscoveryEngine::perform_scan(bool is_polling)
{
    end_session();

    ScanSession session;
    session.generation = ++generation_;
    session_ = std::move(session);
    const std::uint64_t generation = session_->generation;

    if (!is_polling) {
        endpoints_.clear();
        publish_snapshot();
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        last_poll_time_ = std::chrono::steady_clock::now();
    }

    BrowseCallbacks callbacks;
    callbacks.on_event = [this, generation](const BrowseEvent& event) {
        executor_.post([this, generation, event] { handle_browse_event(generation, event); });
    };
    callbacks.on_failure = [this, generation](const std::string& error) {
        executor_.post([this, generation, error] { handle_browse_failure(generation, error); });
    };

    if (!browser_->start(settings_.service_type, settings_.domain, std::move(callbacks))) {
        handle_browse_failure(generation, "Failed to start service browser");
        return;
    }

    session_->browse_active = true;
    set_state(DiscoveryState::Scanning);

    const PollingPolicy policy = current_policy();
    if (policy.browse_timeout) {
        session_->browse_timer = executor_.post_after(*policy.browse_timeout, [this, generation] {
            if (!session_ || session_->generation != generation) {
                return;
            }
            session_->browse_timer = 0;
            if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
                logger->debug("Low power browse budget exhausted, ending scan {}", generation);
            }
            stop_current_browse();
        });
    }

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->debug("Scan {} started ({})", generation, is_polling ? "poll" : "fresh");
    }
}

void DiscoveryEngine::end_session()
{
    if (!session_) {
        return;
    }
    executor_.cancel_timer(session_->browse_timer);
    if (session_->browse_active) {
        browser_->stop();
    }
    session_.reset();
}

void DiscoveryEngine::stop_current_browse()
{
    if (session_) {
        executor_.cancel_timer(session_->browse_timer);
        session_->browse_timer = 0;
        if (session_->browse_active) {
            browser_->stop();
            session_->browse_active = false;
        }
    }
    if (state() == DiscoveryState::Scanning) {
        set_state(paused_ ? DiscoveryState::Paused : DiscoveryState::Idle);
    }
}

void DiscoveryEngine::schedule_poll()
{
    cancel_poll_timer();
    if (!poll_loop_active_ || shutting_down_) {
        return;
    }
    const auto interval = power_->suggested_polling_interval();
    poll_timer_ = executor_.post_after(interval, [this] { on_poll_tick(); });
}

void DiscoveryEngine::cancel_poll_timer()
{
    executor_.cancel_timer(poll_timer_);
    poll_timer_ = 0;
}

void DiscoveryEngine::on_poll_tick()
{
    poll_timer_ = 0;
    if (!poll_loop_active_) {
        return;
    }

    if (!paused_ && should_perform_poll()) {
        perform_scan(true);
    } else if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->trace("Skipping discovery poll (paused: {})", paused_);
    }

    schedule_poll();
}

bool DiscoveryEngine::should_perform_poll() const
{
    const PollingPolicy policy = current_policy();
    if (!policy.polling_enabled) {
        return false;
    }

    if (policy.min_poll_gap) {
        const auto last_poll = last_poll_time();
        if (last_poll && std::chrono::steady_clock::now() - *last_poll < *policy.min_poll_gap) {
            return false;
        }
    }

    return true;
}

void DiscoveryEngine::handle_browse_event(std::uint64_t generation, const BrowseEvent& event)
{
    if (!session_ || session_->generation != generation) {
        return;
    }

    const std::string key = DiscoveredEndpoint::make_key(event.host, event.port);

    if (event.kind == BrowseEvent::Kind::Removed) {
        session_->processed.erase(key);
        remove_endpoint(key);
        return;
    }

    if (session_->processed.count(key) > 0) {
        return;
    }

    const PollingPolicy policy = current_policy();
    if (policy.validation_budget && endpoints_.size() >= *policy.validation_budget) {
        if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
            logger->debug("Skipping validation of {}: {} endpoints already confirmed in low power mode",
                          key, endpoints_.size());
        }
        return;
    }

    session_->processed.insert(key);

    DiscoveredEndpoint endpoint;
    endpoint.name = event.service_name;
    endpoint.host = event.host;
    endpoint.port = event.port;
    dispatch_validation(std::move(endpoint), policy, generation);
}

void DiscoveryEngine::handle_browse_failure(std::uint64_t generation, const std::string& error)
{
    if (!session_ || session_->generation != generation) {
        return;
    }

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->error("Browser failed: {}", error);
    }

    executor_.cancel_timer(session_->browse_timer);
    session_->browse_timer = 0;
    if (session_->browse_active) {
        browser_->stop();
        session_->browse_active = false;
    }
    set_state(DiscoveryState::Failed, error);
}

void DiscoveryEngine::dispatch_validation(DiscoveredEndpoint endpoint,
                                          const PollingPolicy& policy,
                                          std::uint64_t generation)
{
    reap_validations();

    auto validation = std::async(std::launch::async, [this, endpoint, policy, generation]() mutable {
        bool valid = false;
        try {
            valid = probe_(endpoint, policy);
        } catch (const std::exception& ex) {
            if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
                logger->debug("Validation of {} threw: {}", endpoint.key(), ex.what());
            }
        }
        executor_.post([this, generation, endpoint, valid]() mutable {
            on_validation_result(generation, std::move(endpoint), valid);
        });
    });

    pending_validations_.push_back(validation.share());
}

void DiscoveryEngine::on_validation_result(std::uint64_t generation,
                                           DiscoveredEndpoint endpoint,
                                           bool valid)
{
    if (!valid) {
        return;
    }

    if (!session_ || session_->generation != generation) {
        if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
            logger->debug("Discarding validation of {} from superseded scan {}",
                          endpoint.key(), generation);
        }
        return;
    }

    const std::string key = endpoint.key();
    const bool known = std::any_of(endpoints_.begin(), endpoints_.end(),
                                   [&key](const DiscoveredEndpoint& e) { return e.key() == key; });
    if (known) {
        return;
    }

    endpoint.validated = true;

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->info("Discovered server '{}' at {}", endpoint.name, key);
    }

    endpoints_.push_back(std::move(endpoint));
    publish_snapshot();
}

void DiscoveryEngine::remove_endpoint(const std::string& key)
{
    auto it = std::remove_if(endpoints_.begin(), endpoints_.end(),
                             [&key](const DiscoveredEndpoint& e) { return e.key() == key; });
    if (it == endpoints_.end()) {
        return;
    }
    endpoints_.erase(it, endpoints_.end());

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->info("Server at {} went away", key);
    }
    publish_snapshot();
}

void DiscoveryEngine::publish_snapshot()
{
    broadcaster_.publish(endpoints_);
}

void DiscoveryEngine::reap_validations()
{
    pending_validations_.erase(
        std::remove_if(pending_validations_.begin(), pending_validations_.end(),
                       [](const std::shared_future<void>& validation) {
                           return validation.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                       }),
        pending_validations_.end());
}

void DiscoveryEngine::pause_if_possible()
{
    if (!poll_loop_active_ || user_initiated_) {
        return;
    }
    paused_ = true;
    stop_current_browse();
    set_state(DiscoveryState::Paused);

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->debug("Paused discovery scanning to save battery");
    }
}

void DiscoveryEngine::resume_if_needed()
{
    if (!paused_) {
        return;
    }
    paused_ = false;
    set_state(DiscoveryState::Idle);

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->debug("Resuming discovery scanning");
    }

    const auto last_poll = last_poll_time();
    const bool stale = !last_poll || std::chrono::steady_clock::now() - *last_poll > settings_.staleness;
    if (endpoints_.empty() || stale) {
        perform_scan(false);
    }
}

void DiscoveryEngine::adjust_for_power_mode()
{
    if (!poll_loop_active_) {
        return;
    }

    const bool low_power = power_->is_low_power_mode();
    if (low_power && paused_) {
        return;
    }
    schedule_poll();

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->debug("Adjusted discovery polling for power mode {} (interval {}ms, probe timeout {}ms)",
                      to_string(power_->power_mode()),
                      power_->suggested_polling_interval().count(),
                      current_policy().probe_timeout.count());
    }
}

void DiscoveryEngine::on_power_event(PowerEvent event)
{
    switch (event) {
        case PowerEvent::EnteredBackground:
            handle_entered_background();
            break;
        case PowerEvent::EnteredForeground:
            handle_entered_foreground();
            break;
        case PowerEvent::LowPowerModeChanged:
            handle_low_power_mode_changed();
            break;
        case PowerEvent::BatteryChanged:
            // Picked up by the next tick's policy
            break;
    }
}

void DiscoveryEngine::set_state(DiscoveryState state, const std::string& error)
{
    std::lock_guard<std::mutex> lock(status_mutex_);
    state_ = state;
    if (state == DiscoveryState::Failed) {
        last_error_ = error;
    } else if (state == DiscoveryState::Scanning) {
        last_error_.clear();
    }
}

void DiscoveryEngine::run_sync(std::function<void()> task)
{
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    const bool queued = executor_.post([task = std::move(task), done] {
        try {
            task();
        } catch (const std::exception&) {
            done->set_value();
            throw;
        }
        done->set_value();
    });
    if (queued) {
        future.wait();
    }
}
