/*
 * Streaming chat / pull client with partial-response recovery
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef STREAMING_INGESTION_ENGINE_HPP
#define STREAMING_INGESTION_ENGINE_HPP

#include "FormatAdapters.hpp"
#include "HttpClient.hpp"
#include "IResponseRecoveryStore.hpp"
#include "StreamEvent.hpp"
#include "StreamRequest.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class StreamState {
    Open,
    Completed,      // Done event delivered, recovery entry cleared
    Failed,         // Error event delivered
    Cancelled,      // Stopped by the caller; recovery entry kept
};

std::string to_string(StreamState state);

struct StreamSession;

/**
 * Consumer side of one stream
 *
 * Events arrive in wire order and end with exactly one Done or Error,
 * unless the stream is cancelled, in which case the sequence simply ends.
 * Destroying the handle cancels the stream.
 */
class StreamHandle {
public:
    explicit StreamHandle(std::shared_ptr<StreamSession> session);
    ~StreamHandle();

    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    const std::string& id() const;
    WireFormat format() const;

    /**
     * Blocks for the next event; nullopt at end of sequence
     */
    std::optional<StreamEvent> next();

    /**
     * nullopt on timeout or end of sequence; use is_finished() to tell apart
     */
    std::optional<StreamEvent> next_for(std::chrono::milliseconds timeout);

    /**
     * Abort the transfer. Safe to call repeatedly and after completion.
     */
    void cancel();

    StreamState state() const;
    bool is_finished() const;

    /**
     * Text received so far (concatenated deltas)
     */
    std::string partial_text() const;

private:
    std::shared_ptr<StreamSession> session_;
};

using StreamHandlePtr = std::shared_ptr<StreamHandle>;

/**
 * Opens streaming requests and feeds their bodies through a FormatAdapter
 *
 * Each stream runs on its own worker thread. Every delta is appended to
 * the session buffer and written through to the recovery store before it
 * is handed to the consumer. A Done clears the store entry; errors and
 * cancellation leave it for recover_partial_responses().
 */
class StreamingIngestionEngine {
public:
    /**
     * @param store Recovery store, required
     * @param transport Streaming transport; defaults to libcurl
     * @throws std::invalid_argument if store is null
     */
    explicit StreamingIngestionEngine(RecoveryStorePtr store, StreamTransport transport = nullptr);
    ~StreamingIngestionEngine();

    StreamingIngestionEngine(const StreamingIngestionEngine&) = delete;
    StreamingIngestionEngine& operator=(const StreamingIngestionEngine&) = delete;

    /**
     * Start a stream. The request's session_id, if set, becomes the
     * recovery key; otherwise one is generated.
     * @throws std::invalid_argument if the request is invalid or its
     *         session id belongs to a stream that is still open
     */
    StreamHandlePtr open_stream(const StreamRequest& request);

    /**
     * Pending session id -> partial text, read from the recovery store
     */
    std::map<std::string, std::string> recover_partial_responses() const;

    /**
     * Forget a recovered partial response
     */
    bool discard_partial_response(const std::string& id);

    /**
     * @return false if no open stream has this id
     */
    bool cancel(const std::string& id);
    void cancel_all();

    std::size_t active_session_count() const;

    /**
     * Block until every worker started so far has finished
     */
    void wait_idle();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<StreamSession> session;
    };

    void run_session(const std::shared_ptr<StreamSession>& session, const HttpRequest& http_request);
    bool deliver(StreamSession& session, std::vector<StreamEvent> events);
    void fail(StreamSession& session, StreamEvent error);
    void reap_finished_workers();
    std::string generate_session_id();

    RecoveryStorePtr store_;
    StreamTransport transport_;

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<StreamSession>> active_;
    std::vector<Worker> workers_;
    std::atomic<uint64_t> session_counter_{0};
};

#endif // STREAMING_INGESTION_ENGINE_HPP
