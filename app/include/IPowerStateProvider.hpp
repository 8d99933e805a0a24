/*
 * Device power state abstraction consumed by discovery
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_POWER_STATE_PROVIDER_HPP
#define I_POWER_STATE_PROVIDER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

/**
 * Power efficiency mode derived from battery and low-power state
 */
enum class PowerMode {
    Performance,    // Charging or full, no restrictions
    Balanced,
    Conservative,   // Battery <= 20% and unplugged
    LowPower,       // OS low-power mode enabled
};

enum class BatteryState {
    Unknown,
    Unplugged,
    Charging,
    Full,
};

/**
 * Kinds of power state changes a provider notifies about
 */
enum class PowerEvent {
    EnteredBackground,
    EnteredForeground,
    LowPowerModeChanged,
    BatteryChanged,
};

/**
 * Raw power readings
 */
struct PowerState {
    double battery_level{1.0};              // 0.0 - 1.0
    BatteryState battery_state{BatteryState::Full};
    bool low_power_mode{false};
    bool in_background{false};
};

/**
 * Recommended poll interval: 60s in background, 30s in low-power mode,
 * 20s on low unplugged battery, 5s otherwise.
 */
std::chrono::milliseconds suggested_polling_interval(const PowerState& state);

PowerMode power_mode_for(const PowerState& state);

std::string to_string(PowerMode mode);

/**
 * Read-only view of the device power state
 *
 * Implementations must be thread-safe: discovery queries them from its own
 * thread while notifications may arrive from elsewhere.
 */
class IPowerStateProvider {
public:
    using Listener = std::function<void(PowerEvent)>;
    using ListenerId = std::uint64_t;

    virtual ~IPowerStateProvider() = default;

    virtual bool is_low_power_mode() const = 0;
    virtual bool is_in_background() const = 0;
    virtual double battery_level() const = 0;
    virtual std::chrono::milliseconds suggested_polling_interval() const = 0;
    virtual PowerMode power_mode() const = 0;

    /**
     * Consistent copy of all readings
     */
    virtual PowerState snapshot() const = 0;

    virtual ListenerId add_listener(Listener listener) = 0;

    /**
     * Unregister a listener. When this returns the listener is not running
     * on any other thread and will not be called again, so its captures may
     * be destroyed. May be called from inside a listener.
     */
    virtual void remove_listener(ListenerId id) = 0;
};

using PowerStateProviderPtr = std::shared_ptr<IPowerStateProvider>;

#endif // I_POWER_STATE_PROVIDER_HPP
