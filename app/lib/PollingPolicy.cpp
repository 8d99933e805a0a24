/*
 * Adaptive polling policy implementation
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "PollingPolicy.hpp"

#include <chrono>

std::chrono::milliseconds probe_timeout_for(PowerMode mode)
{
    using namespace std::chrono_literals;
    switch (mode) {
        case PowerMode::Performance: return 5000ms;
        case PowerMode::Balanced: return 3000ms;
        case PowerMode::Conservative: return 2000ms;
        case PowerMode::LowPower: return 1500ms;
    }
    return 3000ms;
}

PollingPolicy compute_polling_policy(const PowerState& state,
                                     bool user_initiated,
                                     const DiscoverySettings& settings)
{
    PollingPolicy policy;
    policy.interval = suggested_polling_interval(state);
    policy.probe_timeout = probe_timeout_for(power_mode_for(state));
    policy.cache_policy = (state.low_power_mode || state.battery_level < 0.2)
        ? CachePolicy::PreferCache
        : CachePolicy::ReloadAlways;

    if (state.in_background && !user_initiated) {
        policy.polling_enabled = false;
        return policy;
    }

    if (state.low_power_mode && !user_initiated) {
        policy.validation_budget = settings.low_power_validation_budget;
        policy.min_poll_gap = settings.low_power_min_poll_gap;
        policy.browse_timeout = settings.low_power_browse_timeout;
    }

    return policy;
}
