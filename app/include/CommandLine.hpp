/*
 * Argument parsing for the llmbeacon command-line tool
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "StreamRequest.hpp"

#include <string>
#include <vector>

enum class CliCommand {
    Help,
    Discover,
    Chat,
    Pull,
    Recover,
};

/**
 * Process exit codes
 */
enum ExitCode : int {
    kExitSuccess = 0,
    kExitFailure = 1,
    kExitCancelled = 130,
};

struct CliOptions {
    CliCommand command{CliCommand::Help};
    std::string config_path;                // Empty: Settings::default_config_path()

    // discover
    int seconds{10};
    bool user_initiated{false};
    bool low_power{false};
    bool background{false};

    // chat / pull
    ProviderKind provider{ProviderKind::Ollama};
    std::string url;                        // Empty: configured URL for the provider
    std::string model;
    std::string session_id;
    std::string prompt;

    // recover
    bool clear{false};
};

struct CliParseResult {
    bool success{false};
    CliOptions options;
    std::string error_message;
};

/**
 * Parse arguments without the program name
 */
CliParseResult parse_command_line(const std::vector<std::string>& args);

std::string usage_text();

/**
 * Model used by `chat` when --model is not given
 */
std::string default_model_for(ProviderKind kind);

#endif // COMMAND_LINE_HPP
