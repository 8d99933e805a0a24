/*
 * Unit tests for the NDJSON and SSE stream adapters
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "FormatAdapters.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

/**
 * Compact textual form of an event list for comparisons
 */
std::vector<std::string> describe(const std::vector<StreamEvent>& events)
{
    std::vector<std::string> out;
    for (const auto& event : events) {
        switch (event.type) {
            case StreamEventType::Delta:
                out.push_back("delta:" + event.text);
                break;
            case StreamEventType::Progress:
                out.push_back("progress:" + event.progress.status);
                break;
            case StreamEventType::Done:
                out.push_back("done");
                break;
            case StreamEventType::Error:
                out.push_back("error:" + event.error.message);
                break;
        }
    }
    return out;
}

void append(std::vector<StreamEvent>& into, std::vector<StreamEvent> events)
{
    into.insert(into.end(), events.begin(), events.end());
}

std::vector<StreamEvent> feed_whole(IFormatAdapter& adapter, const std::string& body)
{
    std::vector<StreamEvent> events = adapter.feed(body);
    append(events, adapter.finish());
    return events;
}

std::vector<StreamEvent> feed_in_chunks(IFormatAdapter& adapter, const std::string& body, std::size_t chunk)
{
    std::vector<StreamEvent> events;
    for (std::size_t offset = 0; offset < body.size(); offset += chunk) {
        append(events, adapter.feed(body.data() + offset, std::min(chunk, body.size() - offset)));
    }
    append(events, adapter.finish());
    return events;
}

const std::string kOllamaChat =
    "{\"message\":{\"content\":\"a\"}}\n"
    "{\"message\":{\"content\":\"b\"}}\n"
    "{\"done\":true}\n";

const std::string kOpenAIChat =
    "data: {\"choices\":[{\"delta\":{\"content\":\"hi\"}}]}\n\n"
    "data: [DONE]\n\n";

} // namespace

// =============================================================================
// NDJSON
// =============================================================================

TEST_CASE("NDJSON chat stream yields deltas then done") {
    NdjsonAdapter adapter;
    auto events = feed_whole(adapter, kOllamaChat);

    REQUIRE(describe(events) == std::vector<std::string>{"delta:a", "delta:b", "done"});
    REQUIRE(adapter.is_finished());
}

TEST_CASE("NDJSON events do not depend on chunk boundaries") {
    NdjsonAdapter whole;
    const auto expected = describe(feed_whole(whole, kOllamaChat));

    for (std::size_t chunk : {1, 2, 3, 7, 16, 31}) {
        NdjsonAdapter split;
        REQUIRE(describe(feed_in_chunks(split, kOllamaChat, chunk)) == expected);
    }
}

TEST_CASE("NDJSON produces nothing after the terminal event") {
    NdjsonAdapter adapter;
    auto events = adapter.feed(kOllamaChat + "{\"message\":{\"content\":\"late\"}}\n");
    append(events, adapter.feed(std::string("{\"response\":\"later\"}\n")));
    append(events, adapter.finish());

    REQUIRE(describe(events) == std::vector<std::string>{"delta:a", "delta:b", "done"});
}

TEST_CASE("NDJSON skips blank and unparseable lines") {
    NdjsonAdapter adapter;
    const std::string body =
        "\n"
        "   \n"
        "{\"message\":{\"content\":\"x\"}}\r\n"
        "{not json\n"
        "[1,2,3]\n"
        "{\"unrelated\":1}\n"
        "{\"response\":\"y\"}\n";

    REQUIRE(describe(feed_whole(adapter, body)) == std::vector<std::string>{"delta:x", "delta:y", "done"});
}

TEST_CASE("NDJSON synthesizes done at end of stream") {
    NdjsonAdapter adapter;
    auto events = adapter.feed(std::string("{\"response\":\"partial\"}\n{\"response\":\"tail\"}"));
    REQUIRE(describe(events) == std::vector<std::string>{"delta:partial"});

    append(events, adapter.finish());
    REQUIRE(describe(events) == std::vector<std::string>{"delta:partial", "delta:tail", "done"});
    REQUIRE(adapter.finish().empty());
}

TEST_CASE("NDJSON final chat chunk with done and empty content is a single done") {
    NdjsonAdapter adapter;
    auto events = feed_whole(adapter,
        "{\"message\":{\"content\":\"ok\"},\"done\":false}\n"
        "{\"message\":{\"content\":\"\"},\"done\":true,\"eval_count\":12}\n");

    REQUIRE(describe(events) == std::vector<std::string>{"delta:ok", "done"});
}

TEST_CASE("NDJSON pull progress carries digest and byte counts") {
    NdjsonAdapter adapter;
    auto events = feed_whole(adapter,
        "{\"status\":\"pulling manifest\"}\n"
        "{\"status\":\"downloading\",\"digest\":\"sha256:abc\",\"total\":200,\"completed\":50}\n"
        "{\"status\":\"success\"}\n");

    REQUIRE(describe(events) == std::vector<std::string>{
        "progress:pulling manifest", "progress:downloading", "progress:success", "done"});

    const PullProgress& first = events[0].progress;
    REQUIRE_FALSE(first.total.has_value());
    REQUIRE(first.fraction() == 0.0);

    const PullProgress& downloading = events[1].progress;
    REQUIRE(downloading.digest == "sha256:abc");
    REQUIRE(downloading.total == std::optional<int64_t>(200));
    REQUIRE(downloading.completed == std::optional<int64_t>(50));
    REQUIRE(downloading.fraction() == 0.25);
    REQUIRE_FALSE(downloading.is_complete());

    REQUIRE(events[2].progress.is_complete());
}

TEST_CASE("NDJSON error line is a terminal protocol error") {
    NdjsonAdapter adapter;
    auto events = feed_whole(adapter,
        "{\"response\":\"a\"}\n"
        "{\"error\":\"model 'nope' not found\"}\n"
        "{\"response\":\"b\"}\n");

    REQUIRE(describe(events) == std::vector<std::string>{"delta:a", "error:model 'nope' not found"});
    REQUIRE(events.back().error.kind == StreamErrorKind::Protocol);
}

TEST_CASE("Stopped adapters ignore further input") {
    NdjsonAdapter adapter;
    adapter.feed(std::string("{\"response\":\"half"));
    adapter.stop();

    REQUIRE(adapter.is_finished());
    REQUIRE(adapter.feed(std::string("\"}\n")).empty());
    REQUIRE(adapter.finish().empty());
}

// =============================================================================
// SSE
// =============================================================================

TEST_CASE("SSE chat stream yields delta then done") {
    SseAdapter adapter;
    auto events = adapter.feed(kOpenAIChat);

    REQUIRE(describe(events) == std::vector<std::string>{"delta:hi", "done"});
    REQUIRE(adapter.is_finished());
    REQUIRE(adapter.finish().empty());
}

TEST_CASE("SSE events do not depend on chunk boundaries") {
    const std::string body =
        ": keep-alive\n\n"
        "data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n\n"
        "data: {\"choices\":[{\"delta\":{\"content\":\"Hel\"}}]}\r\n\r\n"
        "data: {\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}\n\n"
        "data: [DONE]\n\n";

    SseAdapter whole;
    const auto expected = describe(feed_whole(whole, body));
    REQUIRE(expected == std::vector<std::string>{"delta:Hel", "delta:lo", "done"});

    for (std::size_t chunk : {1, 5, 13}) {
        SseAdapter split;
        REQUIRE(describe(feed_in_chunks(split, body, chunk)) == expected);
    }
}

TEST_CASE("SSE ignores non-data lines and malformed payloads") {
    SseAdapter adapter;
    auto events = feed_whole(adapter,
        "event: message\n"
        "id: 7\n"
        "data: {broken\n"
        "data: {\"choices\":[]}\n"
        "data: {\"choices\":[\"odd\"]}\n"
        "data:{\"choices\":[{\"delta\":{\"content\":\"tight\"}}]}\n"
        "data: [DONE]\n");

    REQUIRE(describe(events) == std::vector<std::string>{"delta:tight", "done"});
}

TEST_CASE("SSE stream without [DONE] finishes at end of stream") {
    SseAdapter adapter;
    auto events = feed_whole(adapter, "data: {\"choices\":[{\"delta\":{\"content\":\"x\"}}]}\n\n");

    REQUIRE(describe(events) == std::vector<std::string>{"delta:x", "done"});
}

TEST_CASE("SSE error payload is a terminal protocol error") {
    SseAdapter adapter;
    auto events = feed_whole(adapter,
        "data: {\"error\":{\"message\":\"Rate limit exceeded\",\"code\":429}}\n\n"
        "data: [DONE]\n\n");

    REQUIRE(describe(events) == std::vector<std::string>{"error:Rate limit exceeded"});
    REQUIRE(events[0].error.kind == StreamErrorKind::Protocol);
}

TEST_CASE("make_format_adapter selects the adapter for a wire format") {
    REQUIRE(make_format_adapter(WireFormat::Ndjson)->format() == WireFormat::Ndjson);
    REQUIRE(make_format_adapter(WireFormat::Sse)->format() == WireFormat::Sse);
    REQUIRE(to_string(WireFormat::Sse) == "sse");
}
