/*
 * Concrete power state providers
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef POWER_STATE_PROVIDERS_HPP
#define POWER_STATE_PROVIDERS_HPP

#include "IPowerStateProvider.hpp"

#include <map>
#include <mutex>
#include <string>

/**
 * Provider whose state is set explicitly (CLI flags, tests, host app glue)
 *
 * update() diffs the new state against the old one and notifies listeners
 * outside the state lock, in the order: background/foreground, low-power,
 * battery. Notifications are serialized; remove_listener() waits for one in
 * progress on another thread to finish.
 */
class ManualPowerStateProvider : public IPowerStateProvider {
public:
    explicit ManualPowerStateProvider(PowerState initial = PowerState{});
    ~ManualPowerStateProvider() override = default;

    bool is_low_power_mode() const override;
    bool is_in_background() const override;
    double battery_level() const override;
    std::chrono::milliseconds suggested_polling_interval() const override;
    PowerMode power_mode() const override;
    PowerState snapshot() const override;

    ListenerId add_listener(Listener listener) override;
    void remove_listener(ListenerId id) override;

    void update(const PowerState& state);
    void set_in_background(bool in_background);
    void set_low_power_mode(bool enabled);
    void set_battery(double level, BatteryState state);

private:
    mutable std::mutex mutex_;
    std::recursive_mutex dispatch_mutex_;   // Held while listeners run
    PowerState state_;
    double last_notified_battery_level_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_listener_id_{1};
};

/**
 * Linux provider reading /sys
 *
 * Battery from power_supply/BAT*, low-power mode from the ACPI platform
 * profile ("low-power"). There is no app lifecycle on a desktop, so the
 * background flag is only changed through set_in_background().
 */
class SysfsPowerStateProvider : public ManualPowerStateProvider {
public:
    explicit SysfsPowerStateProvider(std::string sysfs_root = "/sys");

    /**
     * Re-read sysfs and notify listeners about changes
     */
    void refresh();

private:
    PowerState read_state() const;

    std::string sysfs_root_;
};

#endif // POWER_STATE_PROVIDERS_HPP
