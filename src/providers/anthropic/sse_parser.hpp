#pragma once

/**
 * Server-sent-event parser for the Anthropic Messages streaming API.
 *
 * Splits the raw byte stream into lines, decodes each "data:" payload and
 * emits the matching StreamEvent. Usage arrives in two halves (input tokens
 * in message_start, output tokens in message_delta); the parser merges them
 * and always reports the combined counts.
 */

#include "../types.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace talk::providers::anthropic {

class SseParser {
public:
    explicit SseParser(OnEventCallback on_event);

    // Feeds raw response bytes. Complete lines are processed immediately.
    void feed(const char* data, size_t size);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Processes a trailing line that was not newline-terminated.
    void flush();

    // True once message_stop or an error event has been emitted.
    bool saw_terminal() const { return saw_terminal_; }

    // Beginning of the raw body, kept for reporting non-SSE error responses.
    const std::string& raw_prefix() const { return raw_prefix_; }

    // Extracts "error.message" from an API error body, or returns fallback.
    static std::string error_message_from_body(const std::string& body, const std::string& fallback);

private:
    OnEventCallback on_event_;
    std::string buffer_;
    std::string raw_prefix_;
    TokenUsage usage_;
    bool saw_terminal_ = false;

    static constexpr size_t RAW_PREFIX_LIMIT = 4096;

    void process_line(std::string line);
    void handle_event(const nlohmann::json& event);
    void merge_usage(const nlohmann::json& usage);
};

} // namespace talk::providers::anthropic
