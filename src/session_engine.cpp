#include "session_engine.hpp"
#include "errors.hpp"
#include "stream_decoder.hpp"
#include "verbose.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace talk {

using providers::FailureKind;
using providers::StreamEvent;
using providers::StreamError;

std::string turn_state_to_string(TurnState state) {
    switch (state) {
        case TurnState::Idle:
            return "idle";
        case TurnState::AwaitingResponse:
            return "awaiting_response";
        case TurnState::Committing:
            return "committing";
        case TurnState::RollingBack:
            return "rolling_back";
    }
    return "idle";
}

class SessionEngine::TurnGuard {
public:
    TurnGuard(SessionEngine& engine, const std::string& session_id)
        : engine_(engine), session_id_(session_id) {
        std::lock_guard<std::mutex> lock(engine_.state_mutex_);
        if (engine_.in_flight_.count(session_id_) > 0) {
            throw SessionBusyError(session_id_);
        }
        engine_.in_flight_[session_id_] = TurnState::AwaitingResponse;
    }

    ~TurnGuard() {
        std::lock_guard<std::mutex> lock(engine_.state_mutex_);
        engine_.in_flight_.erase(session_id_);
    }

    TurnGuard(const TurnGuard&) = delete;
    TurnGuard& operator=(const TurnGuard&) = delete;

private:
    SessionEngine& engine_;
    std::string session_id_;
};

SessionEngine::SessionEngine(providers::ITransport& transport,
                             const TranscriptStore& store,
                             const PricingTable& pricing,
                             EngineOptions options)
    : transport_(transport)
    , store_(store)
    , pricing_(pricing)
    , accountant_(pricing)
    , options_(std::move(options)) {}

std::string SessionEngine::generate_session_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    // Timestamp alone collides when two sessions start within a second
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 0xffff);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y%m%d_%H%M%S") << '_'
        << std::hex << std::setw(4) << std::setfill('0') << dist(rng);
    return oss.str();
}

Session SessionEngine::create(const std::string& model) const {
    const ModelSpec& spec = pricing_.find(model);

    Session session;
    session.id = generate_session_id();
    session.created_at = now_millis();
    session.model = spec.key;
    session.total_cost = 0.0;

    verbose_log("ENGINE", "Created session " + session.id + " with model " + session.model);
    return session;
}

void SessionEngine::transition(const std::string& session_id, TurnState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = in_flight_.find(session_id);
        if (it != in_flight_.end()) {
            it->second = state;
        }
    }
    verbose_log("ENGINE", session_id + " -> " + turn_state_to_string(state));
}

TurnState SessionEngine::state_of(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = in_flight_.find(session_id);
    return it != in_flight_.end() ? it->second : TurnState::Idle;
}

TurnResult SessionEngine::submit_turn(const Session& session,
                                      const std::string& user_text,
                                      providers::OnTextCallback on_delta,
                                      providers::CancelCallback cancel_check) {
    std::string text = trim(user_text);
    if (text.empty()) {
        throw std::invalid_argument("Message is empty");
    }

    const Role* last = session.last_role();
    if (last && *last == Role::User) {
        throw OutOfOrderTurnError(session.id);
    }

    const ModelSpec& spec = pricing_.find(session.model);

    TurnGuard guard(*this, session.id);
    verbose_log("ENGINE", session.id + " -> " + turn_state_to_string(TurnState::AwaitingResponse));

    // Working copy; the caller's session is only replaced on commit
    Session working = session;
    working.messages.push_back({Role::User, text});

    providers::StreamRequest request;
    request.model = spec.provider_id;
    request.messages = working.messages;
    request.system_prompt = options_.system_prompt;
    request.max_tokens = options_.max_tokens;

    auto cancelled = [&cancel_check]() {
        return cancel_check && cancel_check();
    };

    StreamDecoder decoder(std::move(on_delta));
    transport_.stream(request, [&](const StreamEvent& event) {
        if (!decoder.is_terminated() && cancelled()) {
            decoder.feed(StreamError{FailureKind::Cancelled, "Cancelled"});
            return;
        }
        decoder.feed(event);
    }, cancel_check);

    if (!decoder.is_terminated() && cancelled()) {
        decoder.feed(StreamError{FailureKind::Cancelled, "Cancelled"});
    }

    DecodeOutcome outcome = decoder.finish();
    TurnResult result;

    if (!outcome.ok()) {
        transition(session.id, TurnState::RollingBack);
        verbose_err("ENGINE", session.id + " turn failed (" +
                    providers::failure_kind_to_string(outcome.failed->kind) + "): " +
                    outcome.failed->message);
        result.failure = TurnFailure{outcome.failed->kind, outcome.failed->message};
        return result;
    }

    transition(session.id, TurnState::Committing);

    const Completed& completed = *outcome.completed;
    working.messages.push_back({Role::Assistant, completed.final_text});

    result.usage = completed.usage;
    result.incremental_cost = accountant_.compute(working.model, completed.usage);
    accountant_.accumulate(working, result.incremental_cost);

    try {
        store_.save(working);
    } catch (const PersistenceError& e) {
        verbose_err("ENGINE", session.id + " commit not persisted: " + e.what());
        result.persist_error = e.what();
    }

    verbose_log("ENGINE", session.id + " committed: " +
                std::to_string(completed.usage.input_tokens) + " in / " +
                std::to_string(completed.usage.output_tokens) + " out, " +
                format_cost(result.incremental_cost, 6));

    result.session = std::move(working);
    return result;
}

Session SessionEngine::resume(const std::string& id) const {
    return store_.load(id);
}

std::vector<SessionSummary> SessionEngine::list() const {
    return store_.list();
}

void SessionEngine::remove(const std::string& id) const {
    store_.remove(id);
}

} // namespace talk
