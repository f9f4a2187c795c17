#include "stream_decoder.hpp"
#include "verbose.hpp"
#include <type_traits>

namespace talk {

namespace providers {

std::string failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::ConnectionInterrupted:
            return "connection_interrupted";
        case FailureKind::ProviderError:
            return "provider_error";
        case FailureKind::Cancelled:
            return "cancelled";
    }
    return "provider_error";
}

} // namespace providers

StreamDecoder::StreamDecoder(providers::OnTextCallback on_delta)
    : on_delta_(std::move(on_delta)) {}

void StreamDecoder::feed(const providers::StreamEvent& event) {
    if (outcome_) {
        verbose_log("DECODER", "Ignoring event after terminal marker");
        return;
    }

    std::visit([this](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;

        if constexpr (std::is_same_v<T, providers::TextFragment>) {
            buffer_ += ev.text;
            if (on_delta_ && !ev.text.empty()) {
                on_delta_(ev.text);
            }
        } else if constexpr (std::is_same_v<T, providers::UsageReport>) {
            usage_ = ev.usage;
        } else if constexpr (std::is_same_v<T, providers::StreamSuccess>) {
            outcome_ = DecodeOutcome{Completed{buffer_, usage_}, std::nullopt};
        } else if constexpr (std::is_same_v<T, providers::StreamError>) {
            outcome_ = DecodeOutcome{std::nullopt, Failed{ev.kind, ev.message}};
        }
    }, event);
}

DecodeOutcome StreamDecoder::finish() const {
    if (outcome_) {
        return *outcome_;
    }
    return DecodeOutcome{
        std::nullopt,
        Failed{providers::FailureKind::ConnectionInterrupted, "Stream ended before the message was complete"}
    };
}

} // namespace talk
