/*
 * Streaming ingestion engine implementation
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "StreamingIngestionEngine.hpp"
#include "Channel.hpp"
#include "Logger.hpp"
#include "ProviderFactory.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

constexpr std::size_t kMaxErrorBody = 4096;

bool is_success_status(int status_code)
{
    return status_code >= 200 && status_code < 300;
}

/**
 * "HTTP 401: Incorrect API key" from an error response body
 */
std::string describe_http_error(int status_code, const std::string& body)
{
    std::string detail;

    Json::CharReaderBuilder reader_builder;
    Json::Value root;
    std::istringstream body_stream(body);
    std::string errors;
    try {
        if (Json::parseFromStream(reader_builder, body_stream, &root, &errors) && root.isObject()) {
            const Json::Value& error = root["error"];
            if (error.isString()) {
                detail = error.asString();
            } else if (error.isObject() && error["message"].isString()) {
                detail = error["message"].asString();
            }
        }
    } catch (const Json::Exception&) {
        detail.clear();
    }

    if (detail.empty()) {
        detail = body.substr(0, 200);
    }

    std::string message = "HTTP " + std::to_string(status_code);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

} // namespace

/**
 * State shared between the worker thread and the StreamHandle
 */
struct StreamSession {
    std::string id;
    std::string url;
    WireFormat format{WireFormat::Ndjson};
    std::unique_ptr<IFormatAdapter> adapter;    // Worker thread only
    Channel<StreamEvent> events;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> worker_done{false};

    mutable std::mutex mutex;                   // Guards buffer and state
    std::string buffer;
    StreamState state{StreamState::Open};

    void cancel()
    {
        if (!cancelled.exchange(true)) {
            std::lock_guard<std::mutex> lock(mutex);
            if (state == StreamState::Open) {
                state = StreamState::Cancelled;
            }
        }
        events.cancel();
    }
};

std::string to_string(StreamState state)
{
    switch (state) {
        case StreamState::Open: return "open";
        case StreamState::Completed: return "completed";
        case StreamState::Failed: return "failed";
        case StreamState::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ============================================================================
// StreamHandle
// ============================================================================

StreamHandle::StreamHandle(std::shared_ptr<StreamSession> session)
    : session_(std::move(session))
{}

StreamHandle::~StreamHandle()
{
    cancel();
}

const std::string& StreamHandle::id() const
{
    return session_->id;
}

WireFormat StreamHandle::format() const
{
    return session_->format;
}

std::optional<StreamEvent> StreamHandle::next()
{
    return session_->events.next();
}

std::optional<StreamEvent> StreamHandle::next_for(std::chrono::milliseconds timeout)
{
    return session_->events.next_for(timeout);
}

void StreamHandle::cancel()
{
    session_->cancel();
}

StreamState StreamHandle::state() const
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->state;
}

bool StreamHandle::is_finished() const
{
    return session_->events.is_finished();
}

std::string StreamHandle::partial_text() const
{
    std::lock_guard<std::mutex> lock(session_->mutex);
    return session_->buffer;
}

// ============================================================================
// StreamingIngestionEngine
// ============================================================================

StreamingIngestionEngine::StreamingIngestionEngine(RecoveryStorePtr store, StreamTransport transport)
    : store_(std::move(store))
    , transport_(transport ? std::move(transport) : StreamTransport(curl_stream_request))
{
    if (!store_) {
        throw std::invalid_argument("StreamingIngestionEngine requires a recovery store");
    }
}

StreamingIngestionEngine::~StreamingIngestionEngine()
{
    cancel_all();
    wait_idle();
}

StreamHandlePtr StreamingIngestionEngine::open_stream(const StreamRequest& request)
{
    HttpRequest http_request = ProviderFactory::create_http_request(request);

    auto session = std::make_shared<StreamSession>();
    session->id = request.session_id ? *request.session_id : generate_session_id();
    session->url = http_request.url;
    session->format = ProviderFactory::wire_format_for(request);
    session->adapter = ProviderFactory::create_adapter(request);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        reap_finished_workers();
        if (active_.count(session->id) != 0) {
            throw std::invalid_argument("Stream " + session->id + " is already open");
        }
        active_[session->id] = session;
    }

    // Marks the id pending before any byte arrives; an earlier partial under
    // the same id stays until the new stream delivers text
    if (!store_->get(session->id) && !store_->put(session->id, std::string())) {
        if (auto logger = Logger::get_logger(Logger::kStream)) {
            logger->warn("Recovery store rejected entry for stream {}", session->id);
        }
    }

    if (auto logger = Logger::get_logger(Logger::kStream)) {
        logger->info("Opening {} stream {} to {} ({})",
                     request.kind == StreamKind::Pull ? "pull" : to_string(request.provider),
                     session->id, http_request.url, to_string(session->format));
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        try {
            workers_.push_back(Worker{
                std::thread(&StreamingIngestionEngine::run_session, this, session, std::move(http_request)),
                session});
        } catch (const std::system_error&) {
            active_.erase(session->id);
            throw;
        }
    }

    return std::make_shared<StreamHandle>(session);
}

std::map<std::string, std::string> StreamingIngestionEngine::recover_partial_responses() const
{
    std::map<std::string, std::string> partials;
    for (const auto& id : store_->list_pending_ids()) {
        if (auto text = store_->get(id)) {
            partials.emplace(id, std::move(*text));
        }
    }
    return partials;
}

bool StreamingIngestionEngine::discard_partial_response(const std::string& id)
{
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (active_.count(id) != 0) {
            return false;
        }
    }
    return store_->remove(id);
}

bool StreamingIngestionEngine::cancel(const std::string& id)
{
    std::shared_ptr<StreamSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = active_.find(id);
        if (it == active_.end()) {
            return false;
        }
        session = it->second;
    }

    session->cancel();
    return true;
}

void StreamingIngestionEngine::cancel_all()
{
    std::vector<std::shared_ptr<StreamSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& entry : active_) {
            sessions.push_back(entry.second);
        }
    }

    for (const auto& session : sessions) {
        session->cancel();
    }
}

std::size_t StreamingIngestionEngine::active_session_count() const
{
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return active_.size();
}

void StreamingIngestionEngine::wait_idle()
{
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        workers.swap(workers_);
    }

    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void StreamingIngestionEngine::run_session(const std::shared_ptr<StreamSession>& session,
                                           const HttpRequest& http_request)
{
    StreamSession& s = *session;

    int http_status = 0;
    bool http_failed = false;
    std::string error_body;

    StreamCallbacks callbacks;
    callbacks.on_status = [&](int status_code) {
        http_status = status_code;
        http_failed = !is_success_status(status_code);
        return !s.cancelled.load();
    };
    callbacks.on_data = [&](const char* data, std::size_t size) {
        if (s.cancelled.load()) {
            return false;
        }
        if (http_failed) {
            // Error bodies are kept for the message only, never parsed as a stream
            error_body.append(data, std::min(size, kMaxErrorBody - error_body.size()));
            return error_body.size() < kMaxErrorBody;
        }
        return deliver(s, s.adapter->feed(data, size));
    };
    callbacks.is_cancelled = [&s] { return s.cancelled.load(); };

    StreamResult result;
    try {
        result = transport_(http_request, callbacks);
    } catch (const std::exception& ex) {
        result.error = ex.what();
    }

    const int status_code = http_status != 0 ? http_status : result.status_code;

    if (s.cancelled.load()) {
        if (auto logger = Logger::get_logger(Logger::kStream)) {
            logger->info("Stream {} cancelled, partial response kept for recovery", s.id);
        }
    } else if (s.adapter->is_finished()) {
        // Terminal event already delivered
    } else if (status_code != 0 && !is_success_status(status_code)) {
        fail(s, StreamEvent::failure(StreamErrorKind::Http,
                                     describe_http_error(status_code, error_body), status_code));
    } else if (!result.error.empty()) {
        fail(s, StreamEvent::failure(StreamErrorKind::Transport, result.error));
    } else if (result.aborted) {
        fail(s, StreamEvent::failure(StreamErrorKind::Transport, "Transfer aborted"));
    } else {
        // Clean EOF without a terminal line
        deliver(s, s.adapter->finish());
    }

    s.adapter->stop();
    s.events.close();

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = active_.find(s.id);
        if (it != active_.end() && it->second == session) {
            active_.erase(it);
        }
    }
    s.worker_done = true;
}

bool StreamingIngestionEngine::deliver(StreamSession& session, std::vector<StreamEvent> events)
{
    for (auto& event : events) {
        switch (event.type) {
            case StreamEventType::Delta: {
                {
                    std::lock_guard<std::mutex> lock(session.mutex);
                    if (session.state != StreamState::Open) {
                        return false;
                    }
                    session.buffer += event.text;
                    if (!store_->put(session.id, session.buffer)) {
                        if (auto logger = Logger::get_logger(Logger::kStream)) {
                            logger->warn("Failed to persist partial response for stream {}", session.id);
                        }
                    }
                }
                session.events.push(std::move(event));
                break;
            }

            case StreamEventType::Progress:
                if (session.cancelled.load()) {
                    return false;
                }
                session.events.push(std::move(event));
                break;

            case StreamEventType::Done: {
                std::size_t length = 0;
                {
                    std::lock_guard<std::mutex> lock(session.mutex);
                    if (session.state != StreamState::Open) {
                        return false;
                    }
                    session.state = StreamState::Completed;
                    length = session.buffer.size();
                    if (!store_->remove(session.id)) {
                        if (auto logger = Logger::get_logger(Logger::kStream)) {
                            logger->warn("Failed to clear recovery entry for stream {}", session.id);
                        }
                    }
                }
                if (auto logger = Logger::get_logger(Logger::kStream)) {
                    logger->info("Stream {} completed ({} bytes of text)", session.id, length);
                }
                session.events.push(std::move(event));
                return false;
            }

            case StreamEventType::Error:
                fail(session, std::move(event));
                return false;
        }
    }
    return !session.cancelled.load();
}

void StreamingIngestionEngine::fail(StreamSession& session, StreamEvent error)
{
    {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (session.state != StreamState::Open) {
            return;
        }
        session.state = StreamState::Failed;
    }

    if (auto logger = Logger::get_logger(Logger::kStream)) {
        logger->error("Stream {} to {} failed: {}", session.id, session.url, error.error.message);
    }
    session.events.push(std::move(error));
}

void StreamingIngestionEngine::reap_finished_workers()
{
    // Caller holds sessions_mutex_
    auto done = std::partition(workers_.begin(), workers_.end(),
                               [](const Worker& worker) { return !worker.session->worker_done.load(); });
    for (auto it = done; it != workers_.end(); ++it) {
        if (it->thread.joinable()) {
            it->thread.join();
        }
    }
    workers_.erase(done, workers_.end());
}

std::string StreamingIngestionEngine::generate_session_id()
{
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> distribution;

    std::ostringstream id;
    id << "stream-" << ++session_counter_ << '-'
       << std::hex << std::setw(8) << std::setfill('0') << distribution(generator);
    return id.str();
}
