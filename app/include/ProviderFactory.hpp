/*
 * Per-provider wire details and request construction
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef PROVIDER_FACTORY_HPP
#define PROVIDER_FACTORY_HPP

#include "FormatAdapters.hpp"
#include "HttpClient.hpp"
#include "StreamRequest.hpp"

#include <memory>
#include <string>

class Settings;

/**
 * How a provider expects a streaming chat to be sent
 */
struct ProviderProfile {
    ProviderKind kind{ProviderKind::Ollama};
    std::string chat_path;                  // Appended to the request base_url
    WireFormat format{WireFormat::Ndjson};
    bool uses_bearer_auth{false};
    HttpHeaders extra_headers;
};

/**
 * Builds profiles, HTTP requests and adapters from StreamRequests and settings
 */
class ProviderFactory {
public:
    static constexpr const char* kPullPath = "/pull";
    static constexpr const char* kOpenRouterReferer = "https://github.com/llmbeacon/llmbeacon";
    static constexpr const char* kOpenRouterTitle = "LLM Beacon";

    static ProviderProfile profile_for(ProviderKind kind);

    /**
     * Wire format the response to this request will use
     */
    static WireFormat wire_format_for(const StreamRequest& request);

    static std::unique_ptr<IFormatAdapter> create_adapter(const StreamRequest& request);

    /**
     * POST with a JSON body and the provider's headers.
     * @throws std::invalid_argument if the request is not valid
     */
    static HttpRequest create_http_request(const StreamRequest& request);

    /**
     * JSON body: {model, messages, stream:true} for chat, {name, stream:true} for pull
     */
    static std::string build_payload(const StreamRequest& request);

    /**
     * Configured API root for the provider
     */
    static std::string base_url_from_settings(ProviderKind kind, const Settings& settings);

    /**
     * OPENAI_API_KEY / OPENROUTER_API_KEY; empty for Ollama or when unset
     */
    static std::string api_key_from_environment(ProviderKind kind);

    /**
     * Chat request against the configured base URL and key for the provider
     */
    static StreamRequest create_chat_request_from_settings(const Settings& settings,
                                                           ProviderKind kind,
                                                           const std::string& model,
                                                           std::vector<ChatMessage> messages);
};

#endif // PROVIDER_FACTORY_HPP
