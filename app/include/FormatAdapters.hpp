/*
 * Incremental parsers for streaming wire formats
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef FORMAT_ADAPTERS_HPP
#define FORMAT_ADAPTERS_HPP

#include "StreamEvent.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace Json {
class CharReader;
class Value;
}

enum class WireFormat {
    Ndjson,     // One JSON object per line (Ollama)
    Sse,        // "data: <payload>" lines (OpenAI-compatible)
};

std::string to_string(WireFormat format);

/**
 * Turns a byte stream into StreamEvents
 *
 * Bytes may arrive split at arbitrary points; feeding a body in one chunk
 * or one byte at a time produces the same events. After a terminal event
 * the adapter ignores further input.
 */
class IFormatAdapter {
public:
    virtual ~IFormatAdapter() = default;

    /**
     * Consume a chunk and return the events it completed, in order
     */
    virtual std::vector<StreamEvent> feed(const char* data, std::size_t size) = 0;

    /**
     * End of body: flush a trailing unterminated line and return the
     * closing events (a synthesized Done if no terminal event was seen)
     */
    virtual std::vector<StreamEvent> finish() = 0;

    /**
     * Discard buffered input and ignore anything further
     */
    virtual void stop() = 0;

    virtual bool is_finished() const = 0;
    virtual WireFormat format() const = 0;

    std::vector<StreamEvent> feed(const std::string& data) { return feed(data.data(), data.size()); }
};

/**
 * Shared line splitting for the line-oriented formats
 */
class LineBufferedAdapter : public IFormatAdapter {
public:
    LineBufferedAdapter();
    ~LineBufferedAdapter() override;

    using IFormatAdapter::feed;
    std::vector<StreamEvent> feed(const char* data, std::size_t size) override;
    std::vector<StreamEvent> finish() override;
    void stop() override;
    bool is_finished() const override { return finished_; }

protected:
    /**
     * Handle one complete line (without its terminator). Appends at most
     * one event.
     */
    virtual void process_line(const std::string& line, std::vector<StreamEvent>& out) = 0;

    /**
     * Strict single-document JSON parse; false on any error
     */
    bool parse_json(const std::string& text, Json::Value& root) const;

private:
    void handle_line(std::string line, std::vector<StreamEvent>& out);

    std::string buffer_;
    bool finished_{false};
    std::unique_ptr<Json::CharReader> reader_;
};

/**
 * Newline-delimited JSON
 *
 *   {"message":{"content":"..."}}            -> Delta
 *   {"response":"..."}                       -> Delta
 *   {"status":"...","total":N,"completed":M} -> Progress
 *   {"done":true}                            -> Done
 *   {"error":"..."}                          -> Error
 *
 * Lines that are not JSON objects are skipped.
 */
class NdjsonAdapter : public LineBufferedAdapter {
public:
    WireFormat format() const override { return WireFormat::Ndjson; }

protected:
    void process_line(const std::string& line, std::vector<StreamEvent>& out) override;
};

/**
 * Server-sent events carrying OpenAI-style chat completion chunks
 *
 *   data: {"choices":[{"delta":{"content":"..."}}]} -> Delta
 *   data: [DONE]                                    -> Done
 *   data: {"error":{"message":"..."}}               -> Error
 *
 * Other lines (comments, event:, id:, blank separators) are ignored, as
 * are payloads that fail to parse.
 */
class SseAdapter : public LineBufferedAdapter {
public:
    static constexpr const char* kDoneSentinel = "[DONE]";

    WireFormat format() const override { return WireFormat::Sse; }

protected:
    void process_line(const std::string& line, std::vector<StreamEvent>& out) override;
};

std::unique_ptr<IFormatAdapter> make_format_adapter(WireFormat format);

#endif // FORMAT_ADAPTERS_HPP
