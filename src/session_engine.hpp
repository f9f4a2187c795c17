#pragma once

/**
 * Streaming session engine.
 *
 * Drives one conversation turn at a time: sends the transcript plus the new
 * user message to the transport, forwards live deltas to the caller, and on
 * success commits the exchange, prices it and saves the session. A failed or
 * cancelled turn commits nothing; the caller's Session is left as it was.
 *
 * Sessions are plain values. Surfaces hold their own Session and replace it
 * with TurnResult::session after a committed turn.
 */

#include "cost.hpp"
#include "pricing.hpp"
#include "providers/provider.hpp"
#include "transcript_store.hpp"
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace talk {

/**
 * Per-turn lifecycle. A session with no turn in flight is Idle.
 */
enum class TurnState {
    Idle,
    AwaitingResponse,   // Only state in which deltas are delivered
    Committing,
    RollingBack
};

std::string turn_state_to_string(TurnState state);

/**
 * Why a turn was rolled back.
 */
struct TurnFailure {
    providers::FailureKind kind = providers::FailureKind::ConnectionInterrupted;
    std::string message;
};

/**
 * Terminal value of submit_turn.
 */
struct TurnResult {
    std::optional<Session> session;       // Updated session (committed turns only)
    std::optional<TurnFailure> failure;   // Set when the turn was rolled back
    TokenUsage usage;                     // Provider-reported usage for the turn
    double incremental_cost = 0.0;        // Cost of this turn in USD
    std::string persist_error;            // Non-empty if the commit could not be saved

    bool committed() const { return session.has_value(); }
    bool persisted() const { return committed() && persist_error.empty(); }
};

/**
 * Options that apply to every request the engine sends.
 */
struct EngineOptions {
    std::string system_prompt;
    int max_tokens = 8000;
};

class SessionEngine {
public:
    SessionEngine(providers::ITransport& transport,
                  const TranscriptStore& store,
                  const PricingTable& pricing,
                  EngineOptions options = {});

    // Non-copyable (tracks in-flight turns)
    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;

    // Starts a new in-memory session. Throws UnknownModelError.
    Session create(const std::string& model) const;

    /**
     * Runs one turn.
     *
     * Throws before any network traffic if the text is blank
     * (std::invalid_argument), the transcript ends with a user message
     * (OutOfOrderTurnError), the session already has a turn in flight
     * (SessionBusyError) or the model is unknown (UnknownModelError).
     *
     * on_delta is called synchronously for each text fragment as it arrives.
     * cancel_check is polled while streaming; returning true aborts the
     * exchange and the turn fails with FailureKind::Cancelled.
     */
    TurnResult submit_turn(const Session& session,
                           const std::string& user_text,
                           providers::OnTextCallback on_delta = nullptr,
                           providers::CancelCallback cancel_check = nullptr);

    // Loads a stored session. Throws SessionNotFoundError or PersistenceError.
    Session resume(const std::string& id) const;

    // Stored sessions, most recent first.
    std::vector<SessionSummary> list() const;

    // Deletes a stored session. Throws SessionNotFoundError or PersistenceError.
    void remove(const std::string& id) const;

    // Current turn state of a session.
    TurnState state_of(const std::string& session_id) const;

    const PricingTable& pricing() const { return pricing_; }
    const CostAccountant& accountant() const { return accountant_; }

private:
    providers::ITransport& transport_;
    const TranscriptStore& store_;
    const PricingTable& pricing_;
    CostAccountant accountant_;
    EngineOptions options_;

    mutable std::mutex state_mutex_;
    std::unordered_map<std::string, TurnState> in_flight_;

    // Marks a session busy for the lifetime of a turn.
    class TurnGuard;

    void transition(const std::string& session_id, TurnState state);

    static std::string generate_session_id();
};

} // namespace talk
