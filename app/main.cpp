/*
 * llmbeacon command-line tool
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CommandLine.hpp"
#include "DiscoveryEngine.hpp"
#include "DnsSdServiceBrowser.hpp"
#include "Logger.hpp"
#include "PowerStateProviders.hpp"
#include "ProviderFactory.hpp"
#include "RecoveryStores.hpp"
#include "Settings.hpp"
#include "StreamingIngestionEngine.hpp"

#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int)
{
    g_interrupted = 1;
}

constexpr std::chrono::milliseconds kPollSlice{100};

void print_snapshot(const EndpointSnapshot& snapshot)
{
    std::cout << "--- " << snapshot.size() << " server(s)\n";
    for (const auto& endpoint : snapshot) {
        std::cout << "  " << endpoint.name << "  " << endpoint.api_url() << '\n';
    }
    std::cout.flush();
}

int run_discover(const CliOptions& options, const Settings& settings)
{
    PowerState power_state;
    power_state.low_power_mode = options.low_power;
    power_state.in_background = options.background;

    auto power = std::make_shared<ManualPowerStateProvider>(power_state);
    auto browser = std::make_shared<DnsSdServiceBrowser>();
    DiscoveryEngine engine(power, browser, nullptr, settings.discovery);

    auto subscription = engine.subscribe();
    engine.start_discovery(options.user_initiated);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(options.seconds);
    while (!g_interrupted && std::chrono::steady_clock::now() < deadline) {
        if (auto snapshot = subscription->next_for(kPollSlice)) {
            print_snapshot(*snapshot);
        }
    }

    engine.stop_discovery();

    if (engine.state() == DiscoveryState::Failed) {
        std::cerr << "Discovery failed: " << engine.last_error() << '\n';
        return kExitFailure;
    }
    return g_interrupted ? kExitCancelled : kExitSuccess;
}

/**
 * Drain a stream to stdout. Ctrl-C cancels it.
 */
int consume_stream(StreamHandle& handle)
{
    while (true) {
        if (g_interrupted) {
            handle.cancel();
        }

        auto event = handle.next_for(kPollSlice);
        if (!event) {
            if (!handle.is_finished()) {
                continue;
            }
            break;
        }

        switch (event->type) {
            case StreamEventType::Delta:
                std::cout << event->text << std::flush;
                break;

            case StreamEventType::Progress: {
                std::cout << event->progress.status;
                if (event->progress.total) {
                    std::cout << "  " << std::fixed << std::setprecision(1)
                              << event->progress.fraction() * 100.0 << '%';
                }
                std::cout << std::endl;
                break;
            }

            case StreamEventType::Done:
                std::cout << std::endl;
                return kExitSuccess;

            case StreamEventType::Error:
                std::cout << std::endl;
                std::cerr << "Error: " << event->error.message << '\n';
                return kExitFailure;
        }
    }

    if (handle.state() == StreamState::Cancelled) {
        std::cout << std::endl;
        std::cerr << "Cancelled; partial response saved as " << handle.id() << '\n';
        return kExitCancelled;
    }
    return kExitFailure;
}

int run_chat(const CliOptions& options, const Settings& settings)
{
    StreamRequest request = ProviderFactory::create_chat_request_from_settings(
        settings, options.provider, options.model, {ChatMessage{MessageRole::User, options.prompt}});
    if (!options.url.empty()) {
        request.base_url = options.url;
    }
    if (!options.session_id.empty()) {
        request.session_id = options.session_id;
    }

    auto store = std::make_shared<JsonFileRecoveryStore>(settings.recovery.store_path);
    StreamingIngestionEngine engine(store);
    auto handle = engine.open_stream(request);
    return consume_stream(*handle);
}

int run_pull(const CliOptions& options, const Settings& settings)
{
    const std::string base_url = options.url.empty() ? settings.providers.ollama_url : options.url;

    auto store = std::make_shared<JsonFileRecoveryStore>(settings.recovery.store_path);
    StreamingIngestionEngine engine(store);
    auto handle = engine.open_stream(StreamRequest::pull(base_url, options.model));
    const int exit_code = consume_stream(*handle);

    // Pull progress is not text worth recovering
    engine.wait_idle();
    if (!engine.discard_partial_response(handle->id())) {
        if (auto logger = Logger::get_logger(Logger::kCore)) {
            logger->warn("Could not clear recovery entry {}", handle->id());
        }
    }
    return exit_code;
}

int run_recover(const CliOptions& options, const Settings& settings)
{
    auto store = std::make_shared<JsonFileRecoveryStore>(settings.recovery.store_path);
    StreamingIngestionEngine engine(store);

    const auto partials = engine.recover_partial_responses();
    if (partials.empty()) {
        std::cout << "No pending responses\n";
        return kExitSuccess;
    }

    for (const auto& [id, text] : partials) {
        std::cout << "[" << id << "]\n" << text << "\n\n";
        if (options.clear && !engine.discard_partial_response(id)) {
            std::cerr << "Failed to discard " << id << '\n';
            return kExitFailure;
        }
    }
    return kExitSuccess;
}

} // namespace

int main(int argc, char* argv[])
{
    const CliParseResult parsed = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    if (!parsed.success) {
        std::cerr << parsed.error_message << "\n\n" << usage_text();
        return kExitFailure;
    }

    const CliOptions& options = parsed.options;
    if (options.command == CliCommand::Help) {
        std::cout << usage_text();
        return kExitSuccess;
    }

    Settings settings;
    try {
        settings = Settings::load(options.config_path.empty() ? Settings::default_config_path()
                                                              : options.config_path);
    } catch (const SettingsError& ex) {
        std::cerr << ex.what() << '\n';
        return kExitFailure;
    }

    Logger::setup_loggers(settings.logging);
    std::signal(SIGINT, handle_sigint);

    try {
        switch (options.command) {
            case CliCommand::Discover: return run_discover(options, settings);
            case CliCommand::Chat: return run_chat(options, settings);
            case CliCommand::Pull: return run_pull(options, settings);
            case CliCommand::Recover: return run_recover(options, settings);
            case CliCommand::Help: break;
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << '\n';
        return kExitFailure;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger(Logger::kCore)) {
            logger->critical("Unhandled error: {}", ex.what());
        }
        std::cerr << ex.what() << '\n';
        return kExitFailure;
    }
    return kExitSuccess;
}
