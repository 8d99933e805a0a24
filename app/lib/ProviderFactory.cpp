/*
 * Provider profiles and request construction
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "ProviderFactory.hpp"
#include "Settings.hpp"

#include <cstdlib>
#include <stdexcept>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

std::string join_url(std::string base, const std::string& path)
{
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

} // namespace

ProviderProfile ProviderFactory::profile_for(ProviderKind kind)
{
    ProviderProfile profile;
    profile.kind = kind;

    switch (kind) {
        case ProviderKind::Ollama:
            profile.chat_path = "/chat";
            profile.format = WireFormat::Ndjson;
            profile.uses_bearer_auth = false;
            break;

        case ProviderKind::OpenAI:
            profile.chat_path = "/chat/completions";
            profile.format = WireFormat::Sse;
            profile.uses_bearer_auth = true;
            break;

        case ProviderKind::OpenRouter:
            profile.chat_path = "/chat/completions";
            profile.format = WireFormat::Sse;
            profile.uses_bearer_auth = true;
            profile.extra_headers.emplace_back("HTTP-Referer", kOpenRouterReferer);
            profile.extra_headers.emplace_back("X-Title", kOpenRouterTitle);
            break;
    }
    return profile;
}

WireFormat ProviderFactory::wire_format_for(const StreamRequest& request)
{
    if (request.kind == StreamKind::Pull) {
        return WireFormat::Ndjson;
    }
    return profile_for(request.provider).format;
}

std::unique_ptr<IFormatAdapter> ProviderFactory::create_adapter(const StreamRequest& request)
{
    return make_format_adapter(wire_format_for(request));
}

HttpRequest ProviderFactory::create_http_request(const StreamRequest& request)
{
    const std::string problem = request.validation_error();
    if (!problem.empty()) {
        throw std::invalid_argument("Invalid stream request: " + problem);
    }

    const ProviderProfile profile = profile_for(request.provider);

    HttpRequest http;
    http.method = "POST";
    http.url = join_url(request.base_url,
                        request.kind == StreamKind::Pull ? kPullPath : profile.chat_path);
    http.body = build_payload(request);
    http.timeout_ms = request.timeout_ms;

    http.headers.emplace_back("Content-Type", "application/json");
    http.headers.emplace_back("Accept", profile.format == WireFormat::Sse && request.kind == StreamKind::Chat
                                            ? "text/event-stream"
                                            : "application/x-ndjson");

    if (!request.bearer_token.empty()) {
        http.headers.emplace_back("Authorization", "Bearer " + request.bearer_token);
    }
    for (const auto& header : profile.extra_headers) {
        http.headers.push_back(header);
    }
    return http;
}

std::string ProviderFactory::build_payload(const StreamRequest& request)
{
    Json::Value root(Json::objectValue);
    root["stream"] = true;

    if (request.kind == StreamKind::Pull) {
        root["name"] = request.model;
    } else {
        root["model"] = request.model;
        Json::Value messages(Json::arrayValue);
        for (const auto& message : request.messages) {
            Json::Value entry(Json::objectValue);
            entry["role"] = to_string(message.role);
            entry["content"] = message.content;
            messages.append(entry);
        }
        root["messages"] = messages;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

std::string ProviderFactory::base_url_from_settings(ProviderKind kind, const Settings& settings)
{
    switch (kind) {
        case ProviderKind::Ollama: return settings.providers.ollama_url;
        case ProviderKind::OpenAI: return settings.providers.openai_url;
        case ProviderKind::OpenRouter: return settings.providers.openrouter_url;
    }
    return {};
}

std::string ProviderFactory::api_key_from_environment(ProviderKind kind)
{
    const char* env_var = nullptr;
    switch (kind) {
        case ProviderKind::Ollama:
            return {};
        case ProviderKind::OpenAI:
            env_var = "OPENAI_API_KEY";
            break;
        case ProviderKind::OpenRouter:
            env_var = "OPENROUTER_API_KEY";
            break;
    }

    const char* value = env_var ? std::getenv(env_var) : nullptr;
    return value ? std::string(value) : std::string();
}

StreamRequest ProviderFactory::create_chat_request_from_settings(const Settings& settings,
                                                                 ProviderKind kind,
                                                                 const std::string& model,
                                                                 std::vector<ChatMessage> messages)
{
    StreamRequest request = StreamRequest::chat(kind, base_url_from_settings(kind, settings),
                                                model, std::move(messages));
    request.bearer_token = api_key_from_environment(kind);
    return request;
}
