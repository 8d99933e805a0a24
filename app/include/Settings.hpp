/*
 * Application settings loaded from a JSON config file
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * Thrown when a config file exists but cannot be read or parsed
 */
class SettingsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct LoggingSettings {
    std::string level{"info"};
    std::string file;                       // Empty: stderr only
};

struct DiscoverySettings {
    std::string service_type{"_http._tcp"};
    std::string domain{"local."};
    std::chrono::milliseconds staleness{std::chrono::seconds(60)};   // Foreground resume threshold
    std::chrono::milliseconds low_power_min_poll_gap{std::chrono::seconds(120)};
    std::chrono::milliseconds low_power_browse_timeout{std::chrono::seconds(15)};
    std::size_t low_power_validation_budget{3};
};

struct ProviderSettings {
    std::string ollama_url{"http://localhost:11434/api"};
    std::string openai_url{"https://api.openai.com/v1"};
    std::string openrouter_url{"https://openrouter.ai/api/v1"};
};

struct RecoverySettings {
    std::string store_path;
};

/**
 * Settings for the library and the CLI
 *
 * Missing keys keep their defaults. Environment overrides are applied
 * after the file: LLMBEACON_LOG_LEVEL, LLMBEACON_OLLAMA_URL.
 */
class Settings {
public:
    Settings();

    /**
     * Load from a JSON file. A missing file yields defaults.
     * @throws SettingsError if the file is unreadable or malformed
     */
    static Settings load(const std::string& path);

    /**
     * Parse settings from JSON text
     * @throws SettingsError on malformed JSON or wrongly typed values
     */
    static Settings from_json_text(const std::string& text);

    /**
     * $XDG_CONFIG_HOME/llmbeacon/config.json or ~/.config/llmbeacon/config.json
     */
    static std::string default_config_path();

    static std::string default_recovery_path();

    void apply_environment();

    LoggingSettings logging;
    DiscoverySettings discovery;
    ProviderSettings providers;
    RecoverySettings recovery;
};

#endif // SETTINGS_HPP
