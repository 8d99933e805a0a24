/*
 * Command-line argument parsing
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CommandLine.hpp"

#include <stdexcept>

namespace {

CliParseResult failure(std::string message)
{
    CliParseResult result;
    result.success = false;
    result.error_message = std::move(message);
    return result;
}

bool take_value(const std::vector<std::string>& args, std::size_t& index, std::string& value)
{
    if (index + 1 >= args.size()) {
        return false;
    }
    value = args[++index];
    return true;
}

} // namespace

CliParseResult parse_command_line(const std::vector<std::string>& args)
{
    CliParseResult result;
    CliOptions& options = result.options;
    std::vector<std::string> positional;
    bool have_command = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string value;

        if (arg == "-h" || arg == "--help") {
            options.command = CliCommand::Help;
            result.success = true;
            return result;
        }

        if (arg == "--config") {
            if (!take_value(args, i, options.config_path)) {
                return failure("--config requires a path");
            }
            continue;
        }

        if (!have_command) {
            if (arg == "discover") {
                options.command = CliCommand::Discover;
            } else if (arg == "chat") {
                options.command = CliCommand::Chat;
            } else if (arg == "pull") {
                options.command = CliCommand::Pull;
            } else if (arg == "recover") {
                options.command = CliCommand::Recover;
            } else if (arg == "help") {
                options.command = CliCommand::Help;
            } else {
                return failure("Unknown command: " + arg);
            }
            have_command = true;
            continue;
        }

        const CliCommand command = options.command;

        if (command == CliCommand::Discover && arg == "--seconds") {
            if (!take_value(args, i, value)) {
                return failure("--seconds requires a value");
            }
            try {
                std::size_t consumed = 0;
                options.seconds = std::stoi(value, &consumed);
                if (consumed != value.size() || options.seconds <= 0) {
                    return failure("--seconds must be a positive integer");
                }
            } catch (const std::exception&) {
                return failure("--seconds must be a positive integer");
            }
        } else if (command == CliCommand::Discover && arg == "--user") {
            options.user_initiated = true;
        } else if (command == CliCommand::Discover && arg == "--low-power") {
            options.low_power = true;
        } else if (command == CliCommand::Discover && arg == "--background") {
            options.background = true;
        } else if (command == CliCommand::Chat && arg == "--provider") {
            if (!take_value(args, i, value)) {
                return failure("--provider requires a value");
            }
            auto kind = provider_kind_from_string(value);
            if (!kind) {
                return failure("Unknown provider: " + value);
            }
            options.provider = *kind;
        } else if ((command == CliCommand::Chat || command == CliCommand::Pull) && arg == "--url") {
            if (!take_value(args, i, options.url)) {
                return failure("--url requires a value");
            }
        } else if (command == CliCommand::Chat && arg == "--model") {
            if (!take_value(args, i, options.model)) {
                return failure("--model requires a value");
            }
        } else if (command == CliCommand::Chat && arg == "--id") {
            if (!take_value(args, i, options.session_id) || options.session_id.empty()) {
                return failure("--id requires a value");
            }
        } else if (command == CliCommand::Recover && arg == "--clear") {
            options.clear = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return failure("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    switch (options.command) {
        case CliCommand::Chat:
            if (positional.empty()) {
                return failure("chat requires a prompt");
            }
            for (const auto& word : positional) {
                if (!options.prompt.empty()) {
                    options.prompt += ' ';
                }
                options.prompt += word;
            }
            if (options.model.empty()) {
                options.model = default_model_for(options.provider);
            }
            break;

        case CliCommand::Pull:
            if (positional.size() != 1) {
                return failure("pull requires exactly one model name");
            }
            options.model = positional.front();
            break;

        default:
            if (!positional.empty()) {
                return failure("Unexpected argument: " + positional.front());
            }
            break;
    }

    result.success = true;
    return result;
}

std::string usage_text()
{
    return
        "Usage: llmbeacon [--config PATH] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  discover [--seconds N] [--user] [--low-power] [--background]\n"
        "      Browse the local network for inference servers\n"
        "  chat [--provider ollama|openai|openrouter] [--url URL] [--model M] [--id ID] PROMPT\n"
        "      Stream a chat completion; Ctrl-C cancels and keeps the partial text\n"
        "  pull [--url URL] MODEL\n"
        "      Download a model on an Ollama server\n"
        "  recover [--clear]\n"
        "      Show partial responses left by interrupted streams\n";
}

std::string default_model_for(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::Ollama: return "llama3.2";
        case ProviderKind::OpenAI: return "gpt-4o-mini";
        case ProviderKind::OpenRouter: return "openrouter/auto";
    }
    return {};
}
