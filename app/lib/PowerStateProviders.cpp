/*
 * Power state model and providers
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "PowerStateProviders.hpp"
#include "Logger.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <vector>

namespace {

// Battery changes below this are not worth waking discovery for
constexpr double kBatteryNotifyDelta = 0.05;

std::string read_trimmed(const std::filesystem::path& path)
{
    std::ifstream in(path);
    std::string value;
    if (in) {
        std::getline(in, value);
    }
    while (!value.empty() && (value.back() == '\n' || value.back() == ' ' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

} // namespace

std::chrono::milliseconds suggested_polling_interval(const PowerState& state)
{
    using namespace std::chrono_literals;
    if (state.in_background) {
        return 60s;
    }
    if (state.low_power_mode) {
        return 30s;
    }
    if (state.battery_level <= 0.2 && state.battery_state == BatteryState::Unplugged) {
        return 20s;
    }
    return 5s;
}

PowerMode power_mode_for(const PowerState& state)
{
    if (state.low_power_mode) {
        return PowerMode::LowPower;
    }
    if (state.battery_level <= 0.2 && state.battery_state == BatteryState::Unplugged) {
        return PowerMode::Conservative;
    }
    if (state.battery_state == BatteryState::Charging || state.battery_state == BatteryState::Full) {
        return PowerMode::Performance;
    }
    return PowerMode::Balanced;
}

std::string to_string(PowerMode mode)
{
    switch (mode) {
        case PowerMode::Performance: return "Performance";
        case PowerMode::Balanced: return "Balanced";
        case PowerMode::Conservative: return "Conservative";
        case PowerMode::LowPower: return "Low Power";
    }
    return "Unknown";
}

ManualPowerStateProvider::ManualPowerStateProvider(PowerState initial)
    : state_(initial)
    , last_notified_battery_level_(initial.battery_level)
{}

bool ManualPowerStateProvider::is_low_power_mode() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.low_power_mode;
}

bool ManualPowerStateProvider::is_in_background() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.in_background;
}

double ManualPowerStateProvider::battery_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.battery_level;
}

std::chrono::milliseconds ManualPowerStateProvider::suggested_polling_interval() const
{
    return ::suggested_polling_interval(snapshot());
}

PowerMode ManualPowerStateProvider::power_mode() const
{
    return power_mode_for(snapshot());
}

PowerState ManualPowerStateProvider::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

IPowerStateProvider::ListenerId ManualPowerStateProvider::add_listener(Listener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ManualPowerStateProvider::remove_listener(ListenerId id)
{
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

void ManualPowerStateProvider::update(const PowerState& state)
{
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);

    std::vector<PowerEvent> events;
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state.in_background != state_.in_background) {
            events.push_back(state.in_background ? PowerEvent::EnteredBackground
                                                 : PowerEvent::EnteredForeground);
        }
        if (state.low_power_mode != state_.low_power_mode) {
            events.push_back(PowerEvent::LowPowerModeChanged);
        }
        if (state.battery_state != state_.battery_state ||
            std::fabs(state.battery_level - last_notified_battery_level_) > kBatteryNotifyDelta) {
            events.push_back(PowerEvent::BatteryChanged);
            last_notified_battery_level_ = state.battery_level;
        }
        state_ = state;

        if (events.empty()) {
            return;
        }
        listeners.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }

    if (auto logger = Logger::get_logger(Logger::kCore)) {
        logger->debug("Power status changed - battery: {:.0f}%, low power: {}, background: {}",
                      state.battery_level * 100.0, state.low_power_mode, state.in_background);
    }

    for (PowerEvent event : events) {
        for (const auto& listener : listeners) {
            listener(event);
        }
    }
}

void ManualPowerStateProvider::set_in_background(bool in_background)
{
    PowerState state = snapshot();
    state.in_background = in_background;
    update(state);
}

void ManualPowerStateProvider::set_low_power_mode(bool enabled)
{
    PowerState state = snapshot();
    state.low_power_mode = enabled;
    update(state);
}

void ManualPowerStateProvider::set_battery(double level, BatteryState battery_state)
{
    PowerState state = snapshot();
    state.battery_level = level;
    state.battery_state = battery_state;
    update(state);
}

SysfsPowerStateProvider::SysfsPowerStateProvider(std::string sysfs_root)
    : ManualPowerStateProvider(PowerState{})
    , sysfs_root_(std::move(sysfs_root))
{
    refresh();
}

void SysfsPowerStateProvider::refresh()
{
    update(read_state());
}

PowerState SysfsPowerStateProvider::read_state() const
{
    namespace fs = std::filesystem;

    PowerState state = snapshot();
    const fs::path supply_dir = fs::path(sysfs_root_) / "class" / "power_supply";

    std::error_code ec;
    if (fs::is_directory(supply_dir, ec)) {
        for (const auto& entry : fs::directory_iterator(supply_dir, ec)) {
            const std::string name = entry.path().filename().string();
            if (name.rfind("BAT", 0) != 0) {
                continue;
            }

            const std::string capacity = read_trimmed(entry.path() / "capacity");
            if (!capacity.empty()) {
                try {
                    state.battery_level = std::stod(capacity) / 100.0;
                } catch (const std::exception&) {
                    state.battery_level = 1.0;
                }
            }

            const std::string status = read_trimmed(entry.path() / "status");
            if (status == "Charging") {
                state.battery_state = BatteryState::Charging;
            } else if (status == "Full") {
                state.battery_state = BatteryState::Full;
            } else if (status == "Discharging" || status == "Not charging") {
                state.battery_state = BatteryState::Unplugged;
            } else {
                state.battery_state = BatteryState::Unknown;
            }
            break;
        }
    }

    const std::string profile = read_trimmed(fs::path(sysfs_root_) / "firmware" / "acpi" / "platform_profile");
    state.low_power_mode = (profile == "low-power");

    return state;
}
