/*
 * HTTP request/response types and libcurl-backed transports
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string url;
    std::string method{"GET"};
    std::string body;
    HttpHeaders headers;
    int timeout_ms{0};                      // 0: no overall timeout
};

struct HttpResponse {
    int status_code{0};
    std::string body;
    std::string error;                      // Transport error, empty if a response arrived
    bool success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * One-shot request. Injected as a std::function for testability.
 */
using HttpClient = std::function<HttpResponse(const HttpRequest& request)>;

/**
 * Callbacks driven by a streaming transport, in order:
 * on_status once, then on_data for each received chunk.
 * Returning false from either aborts the transfer.
 */
struct StreamCallbacks {
    std::function<bool(int status_code)> on_status;
    std::function<bool(const char* data, std::size_t size)> on_data;
    std::function<bool()> is_cancelled;     // Polled while the transfer is idle
};

struct StreamResult {
    int status_code{0};
    bool aborted{false};                    // A callback or is_cancelled stopped it
    std::string error;                      // Transport error, empty on clean EOF
};

/**
 * Long-lived request whose body is delivered incrementally
 */
using StreamTransport = std::function<StreamResult(const HttpRequest& request,
                                                   const StreamCallbacks& callbacks)>;

/**
 * Blocking request through libcurl
 */
HttpResponse curl_http_request(const HttpRequest& request);

/**
 * Streaming request through libcurl. Keeps the connection open and hands
 * each chunk to the callbacks as it arrives.
 */
StreamResult curl_stream_request(const HttpRequest& request, const StreamCallbacks& callbacks);

#endif // HTTP_CLIENT_HPP
