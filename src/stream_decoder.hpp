#pragma once

/**
 * Reduces a sequence of StreamEvents into live deltas and one outcome.
 *
 * Usage:
 *   StreamDecoder decoder([](const std::string& d) { std::cout << d; });
 *   transport.stream(request, [&](const StreamEvent& e) { decoder.feed(e); });
 *   DecodeOutcome outcome = decoder.finish();
 */

#include "providers/types.hpp"
#include <optional>
#include <string>

namespace talk {

/**
 * The stream produced a complete message.
 */
struct Completed {
    std::string final_text;
    TokenUsage usage;
};

/**
 * The stream failed. Any partial text is not a valid message.
 */
struct Failed {
    providers::FailureKind kind = providers::FailureKind::ConnectionInterrupted;
    std::string message;
};

/**
 * Terminal outcome of a decoded stream.
 */
struct DecodeOutcome {
    std::optional<Completed> completed;
    std::optional<Failed> failed;

    bool ok() const { return completed.has_value(); }
};

class StreamDecoder {
public:
    explicit StreamDecoder(providers::OnTextCallback on_delta = nullptr);

    // Consumes one event. Events after a terminal marker are ignored.
    void feed(const providers::StreamEvent& event);

    // Returns true once a success or error marker has been seen.
    bool is_terminated() const { return outcome_.has_value(); }

    // Text accumulated so far (including text of a failed stream).
    const std::string& buffer() const { return buffer_; }

    // Returns the outcome. A stream with no terminal marker is
    // Failed(ConnectionInterrupted).
    DecodeOutcome finish() const;

private:
    providers::OnTextCallback on_delta_;
    std::string buffer_;
    TokenUsage usage_;
    std::optional<DecodeOutcome> outcome_;
};

} // namespace talk
