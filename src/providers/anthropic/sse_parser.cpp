#include "sse_parser.hpp"
#include "../../verbose.hpp"
#include <algorithm>

namespace talk::providers::anthropic {

using json = nlohmann::json;

SseParser::SseParser(OnEventCallback on_event) : on_event_(std::move(on_event)) {}

void SseParser::feed(const char* data, size_t size) {
    if (raw_prefix_.size() < RAW_PREFIX_LIMIT) {
        raw_prefix_.append(data, std::min(size, RAW_PREFIX_LIMIT - raw_prefix_.size()));
    }

    buffer_.append(data, size);

    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        process_line(std::move(line));
    }
}

void SseParser::flush() {
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        process_line(std::move(line));
    }
}

void SseParser::process_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // "event:" lines repeat the type carried inside the data payload
    if (line.compare(0, 5, "data:") != 0) {
        return;
    }

    std::string data = line.substr(5);
    if (!data.empty() && data.front() == ' ') {
        data.erase(0, 1);
    }
    if (data.empty()) {
        return;
    }

    try {
        handle_event(json::parse(data));
    } catch (const json::exception& e) {
        verbose_err("SSE", std::string("Malformed event: ") + e.what() + " - " + truncate(data));
    }
}

void SseParser::merge_usage(const json& usage) {
    if (usage.contains("input_tokens") && usage["input_tokens"].is_number_integer()) {
        usage_.input_tokens = usage["input_tokens"].get<int64_t>();
    }
    if (usage.contains("output_tokens") && usage["output_tokens"].is_number_integer()) {
        usage_.output_tokens = usage["output_tokens"].get<int64_t>();
    }
    on_event_(UsageReport{usage_});
}

void SseParser::handle_event(const json& event) {
    std::string event_type = event.value("type", "");
    verbose_in("SSE", event_type);

    if (event_type == "message_start") {
        if (event.contains("message") && event["message"].contains("usage")) {
            merge_usage(event["message"]["usage"]);
        }
    } else if (event_type == "content_block_delta") {
        if (event.contains("delta") && event["delta"].value("type", "") == "text_delta") {
            std::string text = event["delta"].value("text", "");
            if (!text.empty()) {
                on_event_(TextFragment{text});
            }
        }
    } else if (event_type == "message_delta") {
        if (event.contains("usage")) {
            merge_usage(event["usage"]);
        }
    } else if (event_type == "message_stop") {
        saw_terminal_ = true;
        on_event_(StreamSuccess{});
    } else if (event_type == "error") {
        std::string message = "Unknown API error";
        if (event.contains("error") && event["error"].contains("message")) {
            message = event["error"]["message"].get<std::string>();
        }
        saw_terminal_ = true;
        on_event_(StreamError{FailureKind::ProviderError, message});
    }
    // ping, content_block_start and content_block_stop carry nothing we need
}

std::string SseParser::error_message_from_body(const std::string& body, const std::string& fallback) {
    try {
        json j = json::parse(body);
        if (j.contains("error") && j["error"].is_object() && j["error"].contains("message")) {
            return j["error"]["message"].get<std::string>();
        }
    } catch (const json::exception&) {
        // Not JSON (proxy error page, truncated body)
    }
    return fallback;
}

} // namespace talk::providers::anthropic
