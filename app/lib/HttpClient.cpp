/*
 * libcurl transports
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "HttpClient.hpp"
#include "Logger.hpp"

#include <curl/curl.h>

#include <mutex>

namespace {

constexpr long kConnectTimeoutMs = 10000;

void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response)
{
    const size_t total_size = size * nmemb;
    response->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

struct StreamContext {
    CURL* curl{nullptr};
    const StreamCallbacks* callbacks{nullptr};
    bool status_reported{false};
    bool aborted{false};
    int status_code{0};
};

bool report_status(StreamContext& ctx)
{
    if (ctx.status_reported) {
        return true;
    }
    long code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &code);
    ctx.status_code = static_cast<int>(code);
    ctx.status_reported = true;
    if (ctx.callbacks->on_status && !ctx.callbacks->on_status(ctx.status_code)) {
        ctx.aborted = true;
        return false;
    }
    return true;
}

size_t stream_write_callback(char* data, size_t size, size_t nmemb, void* userdata)
{
    auto* ctx = static_cast<StreamContext*>(userdata);
    const size_t total_size = size * nmemb;

    if (!report_status(*ctx)) {
        return 0;
    }
    if (ctx->callbacks->is_cancelled && ctx->callbacks->is_cancelled()) {
        ctx->aborted = true;
        return 0;
    }
    if (ctx->callbacks->on_data && !ctx->callbacks->on_data(data, total_size)) {
        ctx->aborted = true;
        return 0;
    }
    return total_size;
}

int stream_progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->callbacks->is_cancelled && ctx->callbacks->is_cancelled()) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

curl_slist* build_headers(const HttpHeaders& headers)
{
    curl_slist* curl_headers = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header.c_str());
    }
    return curl_headers;
}

void apply_method(CURL* curl, const HttpRequest& request)
{
    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
}

} // namespace

HttpResponse curl_http_request(const HttpRequest& request)
{
    ensure_curl_initialized();

    HttpResponse result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize cURL";
        return result;
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);

    curl_slist* curl_headers = build_headers(request.headers);
    if (curl_headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);
    }
    apply_method(curl, request);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
    } else {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        result.status_code = static_cast<int>(code);
        result.body = std::move(response_body);
    }

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }
    curl_easy_cleanup(curl);

    return result;
}

StreamResult curl_stream_request(const HttpRequest& request, const StreamCallbacks& callbacks)
{
    ensure_curl_initialized();

    StreamResult result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.error = "Failed to initialize cURL";
        return result;
    }

    StreamContext ctx;
    ctx.curl = curl;
    ctx.callbacks = &callbacks;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);
    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    }
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, stream_progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

    curl_slist* curl_headers = build_headers(request.headers);
    if (curl_headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);
    }
    apply_method(curl, request);

    CURLcode res = curl_easy_perform(curl);

    if (ctx.aborted) {
        result.aborted = true;
    } else if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
    } else {
        // Responses with an empty body never reach the write callback
        if (!report_status(ctx)) {
            result.aborted = true;
        }
    }
    result.status_code = ctx.status_code;

    if (auto logger = Logger::get_logger(Logger::kStream)) {
        logger->trace("Stream transfer to {} ended (status {}, aborted: {}, error: '{}')",
                      request.url, result.status_code, result.aborted, result.error);
    }

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }
    curl_easy_cleanup(curl);

    return result;
}
