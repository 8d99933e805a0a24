/*
 * Adaptive polling policy for endpoint discovery
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef POLLING_POLICY_HPP
#define POLLING_POLICY_HPP

#include "IPowerStateProvider.hpp"
#include "Settings.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

/**
 * How validation probes treat previously fetched responses
 */
enum class CachePolicy {
    ReloadAlways,       // Always issue the probe
    PreferCache,        // Reuse a recent positive result, else load
};

/**
 * Per-tick discovery parameters. Derived, never stored.
 */
struct PollingPolicy {
    bool polling_enabled{true};
    std::chrono::milliseconds interval{5000};
    std::chrono::milliseconds probe_timeout{5000};
    CachePolicy cache_policy{CachePolicy::ReloadAlways};

    // Stop validating once this many endpoints are confirmed
    std::optional<std::size_t> validation_budget;

    // Skip a tick when the previous poll is younger than this
    std::optional<std::chrono::milliseconds> min_poll_gap;

    // End the browse early after this long
    std::optional<std::chrono::milliseconds> browse_timeout;
};

/**
 * Probe timeout for a power mode: 5.0s / 3.0s / 2.0s / 1.5s
 */
std::chrono::milliseconds probe_timeout_for(PowerMode mode);

/**
 * Compute the policy for the current power readings.
 *
 * Background without a user-initiated scan suppresses polling entirely.
 * Low-power mode without a user-initiated scan shortens probes, bounds the
 * browse, spaces ticks apart and caps validation.
 */
PollingPolicy compute_polling_policy(const PowerState& state,
                                     bool user_initiated,
                                     const DiscoverySettings& settings = DiscoverySettings{});

#endif // POLLING_POLICY_HPP
