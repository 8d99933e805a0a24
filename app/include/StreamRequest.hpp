/*
 * Streaming chat and model-pull requests
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef STREAM_REQUEST_HPP
#define STREAM_REQUEST_HPP

#include <optional>
#include <string>
#include <vector>

/**
 * Chat message role
 */
enum class MessageRole {
    System,
    User,
    Assistant,
};

/**
 * A single message in a chat conversation
 */
struct ChatMessage {
    MessageRole role;
    std::string content;
};

std::string to_string(MessageRole role);

/**
 * Backends that speak a streaming chat protocol
 */
enum class ProviderKind {
    Ollama,         // NDJSON, no auth
    OpenAI,         // SSE, bearer token
    OpenRouter,     // SSE, bearer token plus attribution headers
};

std::string to_string(ProviderKind kind);

/**
 * Parse "ollama", "openai" or "openrouter"
 */
std::optional<ProviderKind> provider_kind_from_string(const std::string& name);

enum class StreamKind {
    Chat,
    Pull,           // Ollama model download, always NDJSON
};

/**
 * Everything needed to open one stream
 *
 * base_url is the provider's API root, e.g. "http://10.0.0.5:11434/api"
 * or "https://api.openai.com/v1".
 */
struct StreamRequest {
    StreamKind kind{StreamKind::Chat};
    ProviderKind provider{ProviderKind::Ollama};
    std::string base_url;
    std::string model;                      // Chat: model id. Pull: model to download
    std::vector<ChatMessage> messages;
    std::string bearer_token;               // Empty: no Authorization header
    std::optional<std::string> session_id;  // Caller-chosen recovery key
    int timeout_ms{0};                      // 0: stream until the server closes

    /**
     * Empty string if the request can be sent, otherwise the reason it cannot
     */
    std::string validation_error() const;

    static StreamRequest chat(ProviderKind provider,
                              std::string base_url,
                              std::string model,
                              std::vector<ChatMessage> messages);

    static StreamRequest pull(std::string base_url, std::string model);
};

#endif // STREAM_REQUEST_HPP
