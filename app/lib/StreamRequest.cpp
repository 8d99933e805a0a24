/*
 * Streaming request helpers
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "StreamRequest.hpp"

#include <algorithm>
#include <cctype>

std::string to_string(MessageRole role)
{
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

std::string to_string(ProviderKind kind)
{
    switch (kind) {
        case ProviderKind::Ollama: return "ollama";
        case ProviderKind::OpenAI: return "openai";
        case ProviderKind::OpenRouter: return "openrouter";
    }
    return "unknown";
}

std::optional<ProviderKind> provider_kind_from_string(const std::string& name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "ollama") {
        return ProviderKind::Ollama;
    }
    if (lowered == "openai") {
        return ProviderKind::OpenAI;
    }
    if (lowered == "openrouter") {
        return ProviderKind::OpenRouter;
    }
    return std::nullopt;
}

std::string StreamRequest::validation_error() const
{
    if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
        return "base URL must start with http:// or https://";
    }
    if (model.empty()) {
        return kind == StreamKind::Pull ? "model name to pull is empty" : "model is empty";
    }
    if (kind == StreamKind::Chat && messages.empty()) {
        return "chat request has no messages";
    }
    if (kind == StreamKind::Pull && provider != ProviderKind::Ollama) {
        return "model pull is only supported by Ollama";
    }
    if (session_id && session_id->empty()) {
        return "session id is empty";
    }
    return {};
}

StreamRequest StreamRequest::chat(ProviderKind provider,
                                  std::string base_url,
                                  std::string model,
                                  std::vector<ChatMessage> messages)
{
    StreamRequest request;
    request.kind = StreamKind::Chat;
    request.provider = provider;
    request.base_url = std::move(base_url);
    request.model = std::move(model);
    request.messages = std::move(messages);
    return request;
}

StreamRequest StreamRequest::pull(std::string base_url, std::string model)
{
    StreamRequest request;
    request.kind = StreamKind::Pull;
    request.provider = ProviderKind::Ollama;
    request.base_url = std::move(base_url);
    request.model = std::move(model);
    return request;
}
