/*
 * Logger implementation
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "Logger.hpp"
#include "Settings.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

} // namespace

void Logger::setup_loggers(const LoggingSettings& settings)
{
    std::vector<spdlog::sink_ptr> sinks;
    std::string file_error;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!settings.file.empty()) {
        std::error_code ec;
        const auto parent = std::filesystem::path(settings.file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file, kMaxLogFileSize, kMaxLogFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
        }
    }

    const auto level = parse_level(settings.level);

    for (const char* name : {kCore, kDiscovery, kStream}) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        spdlog::register_logger(logger);
    }

    if (!file_error.empty()) {
        get_logger(kCore)->warn("Cannot open log file {}: {}", settings.file, file_error);
    }
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}

spdlog::level::level_enum Logger::parse_level(const std::string& name)
{
    std::string level = name;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}
