#pragma once

/**
 * Conversation data model shared by the engine, the store and the surfaces.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace talk {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

/**
 * Speaker of a message. Transcripts alternate User, Assistant, User, ...
 */
enum class Role {
    User,
    Assistant
};

// Returns "user" or "assistant".
std::string role_to_string(Role role);

// Parses "user" / "assistant". Throws std::invalid_argument for anything else.
Role role_from_string(const std::string& value);

/**
 * One committed conversational turn.
 */
struct Message {
    Role role = Role::User;
    std::string content;

    // Converts this message to the provider's wire format.
    nlohmann::json to_json() const {
        return {{"role", role_to_string(role)}, {"content", content}};
    }

    bool operator==(const Message& other) const {
        return role == other.role && content == other.content;
    }
    bool operator!=(const Message& other) const { return !(*this == other); }
};

/**
 * Token counts reported by the provider for one exchange.
 */
struct TokenUsage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;

    bool operator==(const TokenUsage& other) const {
        return input_tokens == other.input_tokens && output_tokens == other.output_tokens;
    }
};

/**
 * A persisted, resumable conversation and its accumulated cost.
 */
struct Session {
    std::string id;                  // Unique id, also the storage key.
    TimePoint created_at;            // Creation instant (millisecond precision).
    std::string model;               // Pricing table key, fixed for the session.
    std::vector<Message> messages;   // Committed transcript.
    double total_cost = 0.0;         // Accumulated spend in USD.

    // Returns the role of the last committed message, or nullptr when empty.
    const Role* last_role() const {
        return messages.empty() ? nullptr : &messages.back().role;
    }

    bool operator==(const Session& other) const {
        return id == other.id && created_at == other.created_at && model == other.model &&
               messages == other.messages && total_cost == other.total_cost;
    }
    bool operator!=(const Session& other) const { return !(*this == other); }
};

/**
 * Listing entry for a stored conversation.
 */
struct SessionSummary {
    std::string id;
    TimePoint created_at;
    std::string model;
    std::string preview;         // First user message, shortened.
    double total_cost = 0.0;
    size_t message_count = 0;
};

// Current time truncated to milliseconds.
TimePoint now_millis();

// Formats as ISO 8601 UTC with milliseconds, e.g. 2025-01-31T09:15:02.123Z.
std::string format_timestamp(TimePoint tp);

// Formats as local "YYYY-MM-DD HH:MM" for listings.
std::string format_local_minutes(TimePoint tp);

// Parses the output of format_timestamp. Throws std::invalid_argument.
TimePoint parse_timestamp(const std::string& text);

// Returns the first line of text, cut to max_length code points with "..." appended.
std::string make_preview(const std::string& text, size_t max_length);

// Strips leading and trailing whitespace.
std::string trim(const std::string& text);

} // namespace talk
