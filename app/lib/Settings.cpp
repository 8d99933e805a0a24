/*
 * Settings implementation
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

std::string env_or_empty(const char* name)
{
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path xdg_dir(const char* xdg_var, const char* fallback)
{
    const std::string xdg = env_or_empty(xdg_var);
    if (!xdg.empty()) {
        return std::filesystem::path(xdg);
    }
    const std::string home = env_or_empty("HOME");
    if (!home.empty()) {
        return std::filesystem::path(home) / fallback;
    }
    return std::filesystem::current_path();
}

void read_string(const Json::Value& section, const char* key, std::string& out)
{
    if (!section.isMember(key)) {
        return;
    }
    if (!section[key].isString()) {
        throw SettingsError(std::string("Setting '") + key + "' must be a string");
    }
    out = section[key].asString();
}

void read_seconds(const Json::Value& section, const char* key, std::chrono::milliseconds& out)
{
    if (!section.isMember(key)) {
        return;
    }
    if (!section[key].isUInt()) {
        throw SettingsError(std::string("Setting '") + key + "' must be a non-negative integer");
    }
    out = std::chrono::seconds(section[key].asUInt());
}

const Json::Value& section_of(const Json::Value& root, const char* name)
{
    static const Json::Value empty(Json::objectValue);
    if (!root.isMember(name)) {
        return empty;
    }
    if (!root[name].isObject()) {
        throw SettingsError(std::string("Section '") + name + "' must be an object");
    }
    return root[name];
}

} // namespace

Settings::Settings()
{
    recovery.store_path = default_recovery_path();
}

Settings Settings::load(const std::string& path)
{
    if (!std::filesystem::exists(path)) {
        Settings settings;
        settings.apply_environment();
        return settings;
    }

    std::ifstream file(path);
    if (!file) {
        throw SettingsError("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Settings settings = from_json_text(buffer.str());
    settings.apply_environment();
    return settings;
}

Settings Settings::from_json_text(const std::string& text)
{
    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream stream(text);
    std::string errors;

    if (!Json::parseFromStream(reader_builder, stream, &root, &errors)) {
        throw SettingsError("Failed to parse config: " + errors);
    }
    if (!root.isObject()) {
        throw SettingsError("Config root must be a JSON object");
    }

    Settings settings;

    const Json::Value& logging = section_of(root, "logging");
    read_string(logging, "level", settings.logging.level);
    read_string(logging, "file", settings.logging.file);

    const Json::Value& discovery = section_of(root, "discovery");
    read_string(discovery, "service_type", settings.discovery.service_type);
    read_string(discovery, "domain", settings.discovery.domain);
    read_seconds(discovery, "staleness_seconds", settings.discovery.staleness);
    read_seconds(discovery, "low_power_min_poll_gap_seconds",
                 settings.discovery.low_power_min_poll_gap);
    read_seconds(discovery, "low_power_browse_timeout_seconds",
                 settings.discovery.low_power_browse_timeout);
    if (discovery.isMember("low_power_validation_budget")) {
        if (!discovery["low_power_validation_budget"].isUInt()) {
            throw SettingsError("Setting 'low_power_validation_budget' must be a non-negative integer");
        }
        settings.discovery.low_power_validation_budget =
            discovery["low_power_validation_budget"].asUInt();
    }

    const Json::Value& providers = section_of(root, "providers");
    read_string(providers, "ollama_url", settings.providers.ollama_url);
    read_string(providers, "openai_url", settings.providers.openai_url);
    read_string(providers, "openrouter_url", settings.providers.openrouter_url);

    const Json::Value& recovery = section_of(root, "recovery");
    read_string(recovery, "store_path", settings.recovery.store_path);

    return settings;
}

std::string Settings::default_config_path()
{
    return (xdg_dir("XDG_CONFIG_HOME", ".config") / "llmbeacon" / "config.json").string();
}

std::string Settings::default_recovery_path()
{
    return (xdg_dir("XDG_STATE_HOME", ".local/state") / "llmbeacon" / "recovery.json").string();
}

void Settings::apply_environment()
{
    const std::string level = env_or_empty("LLMBEACON_LOG_LEVEL");
    if (!level.empty()) {
        logging.level = level;
    }
    const std::string ollama_url = env_or_empty("LLMBEACON_OLLAMA_URL");
    if (!ollama_url.empty()) {
        providers.ollama_url = ollama_url;
    }
}
