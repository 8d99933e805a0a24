/*
 * Probe that confirms an endpoint speaks the Ollama chat-server protocol
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef ENDPOINT_VALIDATOR_HPP
#define ENDPOINT_VALIDATOR_HPP

#include "DiscoveredEndpoint.hpp"
#include "HttpClient.hpp"
#include "PollingPolicy.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * Validates candidate endpoints with GET {endpoint}/api/tags
 *
 * A positive result requires HTTP 200 and a JSON object body with a
 * top-level "models" member. Every failure (transport, status, parse,
 * shape, exceptions thrown by the injected client) is a plain false.
 *
 * Safe to call concurrently from several threads.
 */
class EndpointValidator {
public:
    static constexpr const char* kProbePath = "/tags";
    static constexpr const char* kExpectedField = "models";

    /**
     * @param http_client Optional client for testing; libcurl otherwise
     * @param cache_ttl How long a positive result may be reused under PreferCache
     */
    explicit EndpointValidator(HttpClient http_client = nullptr,
                               std::chrono::milliseconds cache_ttl = std::chrono::minutes(5));

    /**
     * Probe with the timeout and cache policy of the given polling policy
     */
    bool validate(const DiscoveredEndpoint& endpoint, const PollingPolicy& policy) const;

    /**
     * Probe with the default (best conditions) policy
     */
    bool validate(const DiscoveredEndpoint& endpoint) const;

    /**
     * Check a probe response without issuing a request
     */
    static bool is_valid_response(const HttpResponse& response);

    void clear_cache();

private:
    bool cached_positive(const std::string& url) const;
    void remember_positive(const std::string& url) const;

    HttpClient http_client_;
    std::chrono::milliseconds cache_ttl_;
    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<std::string, std::chrono::steady_clock::time_point> positive_cache_;
};

using EndpointValidatorPtr = std::shared_ptr<EndpointValidator>;

#endif // ENDPOINT_VALIDATOR_HPP
