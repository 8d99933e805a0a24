/*
 * Named spdlog loggers used across the library
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

struct LoggingSettings;

/**
 * Thin facade over the spdlog registry.
 *
 * Library code never requires the loggers to exist: every call site uses
 * `if (auto logger = Logger::get_logger(...))`, so unit tests can run
 * without calling setup_loggers().
 */
class Logger {
public:
    static constexpr const char* kCore = "core_logger";
    static constexpr const char* kDiscovery = "discovery_logger";
    static constexpr const char* kStream = "stream_logger";

    /**
     * Create and register the core, discovery and stream loggers.
     * Safe to call more than once; later calls replace the sinks.
     */
    static void setup_loggers(const LoggingSettings& settings);

    /**
     * Registered logger or nullptr if setup_loggers() was never called
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static spdlog::level::level_enum parse_level(const std::string& level);
};

#endif // LOGGER_HPP
