#pragma once

/**
 * Types exchanged across the transport boundary.
 *
 * Providers translate their wire protocol into StreamEvent values once, at
 * the boundary. Nothing downstream inspects raw provider payloads.
 */

#include "../types.hpp"
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace talk::providers {

/**
 * Why a stream ended without a complete message.
 */
enum class FailureKind {
    ConnectionInterrupted,  // Network failure or stream ended without a terminal marker
    ProviderError,          // The API reported an error
    Cancelled               // The caller abandoned the turn
};

// Returns "connection_interrupted", "provider_error" or "cancelled".
std::string failure_kind_to_string(FailureKind kind);

/**
 * A piece of assistant text.
 */
struct TextFragment {
    std::string text;
};

/**
 * Token counts seen so far. Later reports supersede earlier ones.
 */
struct UsageReport {
    TokenUsage usage;
};

/**
 * Terminal marker: the message is complete.
 */
struct StreamSuccess {};

/**
 * Terminal marker: the exchange failed.
 */
struct StreamError {
    FailureKind kind = FailureKind::ProviderError;
    std::string message;
};

/**
 * One unit of the inbound streaming protocol.
 */
using StreamEvent = std::variant<TextFragment, UsageReport, StreamSuccess, StreamError>;

/**
 * A streamed completion request.
 */
struct StreamRequest {
    std::string model;               // Provider model id
    std::vector<Message> messages;   // Full history including the new user turn
    std::string system_prompt;       // Optional; omitted when empty
    int max_tokens = 8000;
};

// Callback types

/**
 * Receives each decoded event in arrival order.
 */
using OnEventCallback = std::function<void(const StreamEvent&)>;

/**
 * Receives each live text delta.
 */
using OnTextCallback = std::function<void(const std::string&)>;

/**
 * Callback to check if cancellation has been requested.
 * Returns true if the operation should be cancelled.
 */
using CancelCallback = std::function<bool()>;

} // namespace talk::providers
