/*
 * NDJSON and SSE stream adapters
 * Part of LLM Beacon - local inference server discovery and streaming client
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "FormatAdapters.hpp"
#include "Logger.hpp"

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<int64_t> optional_int(const Json::Value& value)
{
    if (value.isIntegral() || value.isDouble()) {
        return value.asInt64();
    }
    return std::nullopt;
}

std::string error_message(const Json::Value& error)
{
    if (error.isString()) {
        return error.asString();
    }
    if (error.isObject() && error["message"].isString()) {
        return error["message"].asString();
    }
    return error.toStyledString();
}

} // namespace

std::string to_string(StreamEventType type)
{
    switch (type) {
        case StreamEventType::Delta: return "delta";
        case StreamEventType::Progress: return "progress";
        case StreamEventType::Done: return "done";
        case StreamEventType::Error: return "error";
    }
    return "unknown";
}

std::string to_string(WireFormat format)
{
    switch (format) {
        case WireFormat::Ndjson: return "ndjson";
        case WireFormat::Sse: return "sse";
    }
    return "unknown";
}

// ============================================================================
// LineBufferedAdapter
// ============================================================================

LineBufferedAdapter::LineBufferedAdapter()
{
    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    builder["collectComments"] = false;
    reader_.reset(builder.newCharReader());
}

LineBufferedAdapter::~LineBufferedAdapter() = default;

std::vector<StreamEvent> LineBufferedAdapter::feed(const char* data, std::size_t size)
{
    std::vector<StreamEvent> events;
    if (finished_ || size == 0) {
        return events;
    }

    buffer_.append(data, size);

    std::size_t start = 0;
    std::size_t newline;
    while (!finished_ && (newline = buffer_.find('\n', start)) != std::string::npos) {
        handle_line(buffer_.substr(start, newline - start), events);
        start = newline + 1;
    }

    if (finished_) {
        buffer_.clear();
    } else {
        buffer_.erase(0, start);
    }
    return events;
}

std::vector<StreamEvent> LineBufferedAdapter::finish()
{
    std::vector<StreamEvent> events;
    if (finished_) {
        return events;
    }

    if (!buffer_.empty()) {
        std::string last;
        last.swap(buffer_);
        handle_line(std::move(last), events);
    }

    if (!finished_) {
        events.push_back(StreamEvent::done());
        finished_ = true;
    }
    return events;
}

void LineBufferedAdapter::stop()
{
    finished_ = true;
    buffer_.clear();
}

bool LineBufferedAdapter::parse_json(const std::string& text, Json::Value& root) const
{
    std::string errors;
    try {
        return reader_->parse(text.data(), text.data() + text.size(), &root, &errors);
    } catch (const Json::Exception&) {
        return false;
    }
}

void LineBufferedAdapter::handle_line(std::string line, std::vector<StreamEvent>& out)
{
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    const std::size_t before = out.size();
    process_line(line, out);

    if (out.size() > before && out.back().is_terminal()) {
        finished_ = true;
    }
}

// ============================================================================
// NdjsonAdapter
// ============================================================================

void NdjsonAdapter::process_line(const std::string& line, std::vector<StreamEvent>& out)
{
    const std::string text = trim(line);
    if (text.empty()) {
        return;
    }

    Json::Value root;
    if (!parse_json(text, root) || !root.isObject()) {
        if (auto logger = Logger::get_logger(Logger::kStream)) {
            logger->trace("Skipping unparseable NDJSON line: {}", text);
        }
        return;
    }

    if (root.isMember("error") && !root["error"].isNull()) {
        out.push_back(StreamEvent::failure(StreamErrorKind::Protocol, error_message(root["error"])));
        return;
    }

    // A final chat chunk may also carry empty content; done wins.
    if (root["done"].isBool() && root["done"].asBool()) {
        out.push_back(StreamEvent::done());
        return;
    }

    const Json::Value& message = root["message"];
    if (message.isObject() && message["content"].isString()) {
        out.push_back(StreamEvent::delta(message["content"].asString()));
        return;
    }

    if (root["response"].isString()) {
        out.push_back(StreamEvent::delta(root["response"].asString()));
        return;
    }

    if (root["status"].isString()) {
        PullProgress progress;
        progress.status = root["status"].asString();
        if (root["digest"].isString()) {
            progress.digest = root["digest"].asString();
        }
        progress.total = optional_int(root["total"]);
        progress.completed = optional_int(root["completed"]);
        out.push_back(StreamEvent::make_progress(std::move(progress)));
    }
}

// ============================================================================
// SseAdapter
// ============================================================================

void SseAdapter::process_line(const std::string& line, std::vector<StreamEvent>& out)
{
    static const std::string kDataPrefix = "data:";
    if (line.compare(0, kDataPrefix.size(), kDataPrefix) != 0) {
        return;
    }

    const std::string payload = trim(line.substr(kDataPrefix.size()));
    if (payload.empty()) {
        return;
    }

    if (payload == kDoneSentinel) {
        out.push_back(StreamEvent::done());
        return;
    }

    Json::Value root;
    if (!parse_json(payload, root) || !root.isObject()) {
        if (auto logger = Logger::get_logger(Logger::kStream)) {
            logger->trace("Skipping unparseable SSE payload: {}", payload);
        }
        return;
    }

    if (root.isMember("error") && !root["error"].isNull()) {
        out.push_back(StreamEvent::failure(StreamErrorKind::Protocol, error_message(root["error"])));
        return;
    }

    const Json::Value& choices = root["choices"];
    if (!choices.isArray() || choices.empty()) {
        return;
    }

    const Json::Value& choice = choices[0u];
    if (!choice.isObject() || !choice["delta"].isObject()) {
        return;
    }

    const Json::Value& content = choice["delta"]["content"];
    if (content.isString()) {
        out.push_back(StreamEvent::delta(content.asString()));
    }
}

std::unique_ptr<IFormatAdapter> make_format_adapter(WireFormat format)
{
    switch (format) {
        case WireFormat::Ndjson: return std::make_unique<NdjsonAdapter>();
        case WireFormat::Sse: return std::make_unique<SseAdapter>();
    }
    return nullptr;
}
