/*
 * Events produced while reading a streaming response
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef STREAM_EVENT_HPP
#define STREAM_EVENT_HPP

#include <cstdint>
#include <optional>
#include <string>

enum class StreamEventType {
    Delta,      // Incremental response text
    Progress,   // Model pull status
    Done,       // Terminal: completed normally
    Error,      // Terminal: failed
};

enum class StreamErrorKind {
    Transport,  // Connection refused, DNS failure, timeout
    Http,       // Status outside 200-299
    Protocol,   // Error reported inside the body
};

/**
 * Model pull progress as reported by the server
 */
struct PullProgress {
    std::string status;
    std::string digest;
    std::optional<int64_t> total;
    std::optional<int64_t> completed;

    /**
     * completed / total, or 0 when unknown
     */
    double fraction() const
    {
        if (!total || !completed || *total <= 0) {
            return 0.0;
        }
        return static_cast<double>(*completed) / static_cast<double>(*total);
    }

    bool is_complete() const { return status == "success"; }
};

struct StreamError {
    StreamErrorKind kind{StreamErrorKind::Transport};
    std::string message;
    int status_code{0};         // Set for Http errors
};

/**
 * One unit of a stream. Done and Error are terminal: nothing follows them.
 */
struct StreamEvent {
    StreamEventType type{StreamEventType::Delta};
    std::string text;
    PullProgress progress;
    StreamError error;

    static StreamEvent delta(std::string text)
    {
        StreamEvent event;
        event.type = StreamEventType::Delta;
        event.text = std::move(text);
        return event;
    }

    static StreamEvent make_progress(PullProgress progress)
    {
        StreamEvent event;
        event.type = StreamEventType::Progress;
        event.progress = std::move(progress);
        return event;
    }

    static StreamEvent done()
    {
        StreamEvent event;
        event.type = StreamEventType::Done;
        return event;
    }

    static StreamEvent failure(StreamErrorKind kind, std::string message, int status_code = 0)
    {
        StreamEvent event;
        event.type = StreamEventType::Error;
        event.error.kind = kind;
        event.error.message = std::move(message);
        event.error.status_code = status_code;
        return event;
    }

    bool is_terminal() const
    {
        return type == StreamEventType::Done || type == StreamEventType::Error;
    }
};

std::string to_string(StreamEventType type);

#endif // STREAM_EVENT_HPP
