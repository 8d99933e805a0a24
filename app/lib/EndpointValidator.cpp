/*
 * Endpoint validator implementation
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "EndpointValidator.hpp"
#include "Logger.hpp"

#include <sstream>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

EndpointValidator::EndpointValidator(HttpClient http_client, std::chrono::milliseconds cache_ttl)
    : http_client_(std::move(http_client))
    , cache_ttl_(cache_ttl)
{}

bool EndpointValidator::validate(const DiscoveredEndpoint& endpoint) const
{
    return validate(endpoint, PollingPolicy{});
}

bool EndpointValidator::validate(const DiscoveredEndpoint& endpoint, const PollingPolicy& policy) const
{
    const std::string url = endpoint.api_url() + kProbePath;

    if (policy.cache_policy == CachePolicy::PreferCache && cached_positive(url)) {
        if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
            logger->debug("Using cached validation for {}", url);
        }
        return true;
    }

    HttpRequest request;
    request.url = url;
    request.method = "GET";
    request.headers.emplace_back("Accept", "application/json");
    request.timeout_ms = static_cast<int>(policy.probe_timeout.count());

    HttpResponse response;
    try {
        response = http_client_ ? http_client_(request) : curl_http_request(request);
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
            logger->debug("Failed to validate server at {}: {}", endpoint.host, ex.what());
        }
        return false;
    }

    if (!response.error.empty()) {
        if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
            logger->debug("Failed to validate server at {}: {}", endpoint.host, response.error);
        }
        return false;
    }

    const bool valid = is_valid_response(response);
    if (valid) {
        remember_positive(url);
    }

    if (auto logger = Logger::get_logger(Logger::kDiscovery)) {
        logger->debug("Validation of {} -> {} (status {})", url, valid ? "ok" : "rejected",
                      response.status_code);
    }
    return valid;
}

bool EndpointValidator::is_valid_response(const HttpResponse& response)
{
    if (response.status_code != 200) {
        return false;
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream response_stream(response.body);
    std::string errors;

    try {
        if (!Json::parseFromStream(reader_builder, response_stream, &root, &errors)) {
            return false;
        }
    } catch (const Json::Exception&) {
        return false;
    }

    return root.isObject() && root.isMember(kExpectedField);
}

void EndpointValidator::clear_cache()
{
    std::lock_guard<std::mutex> lock(cache_mutex_);
    positive_cache_.clear();
}

bool EndpointValidator::cached_positive(const std::string& url) const
{
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = positive_cache_.find(url);
    if (it == positive_cache_.end()) {
        return false;
    }
    if (std::chrono::steady_clock::now() - it->second > cache_ttl_) {
        positive_cache_.erase(it);
        return false;
    }
    return true;
}

void EndpointValidator::remember_positive(const std::string& url) const
{
    std::lock_guard<std::mutex> lock(cache_mutex_);
    positive_cache_[url] = std::chrono::steady_clock::now();
}
