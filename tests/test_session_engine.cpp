#include <catch2/catch.hpp>
#include "errors.hpp"
#include "session_engine.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <fstream>
#include <future>
#include <thread>

using namespace talk;
using namespace talk::providers;
using talk::testing::ScriptedTransport;
using talk::testing::TempDir;

namespace {

// Engine wired to a scripted transport and a scratch store.
struct Fixture {
    TempDir dir;
    ScriptedTransport transport;
    PricingTable pricing;
    TranscriptStore store{dir.path()};
    SessionEngine engine{transport, store, pricing, {"Be brief.", 4096}};
};

} // namespace

TEST_CASE("New session is empty and priced by key", "[engine]") {
    Fixture f;

    Session session = f.engine.create("Claude Opus 4");
    REQUIRE(session.model == "opus-4");
    REQUIRE(session.messages.empty());
    REQUIRE(session.total_cost == 0.0);
    REQUIRE(TranscriptStore::is_valid_id(session.id));
    REQUIRE(f.engine.state_of(session.id) == TurnState::Idle);

    // Nothing is persisted until the first commit
    REQUIRE_FALSE(f.store.exists(session.id));

    REQUIRE(f.engine.create("sonnet-4.5").id != session.id);
    REQUIRE_THROWS_AS(f.engine.create("gpt-4o"), UnknownModelError);
}

TEST_CASE("Successful turn commits both messages, prices and saves", "[engine]") {
    Fixture f;
    f.transport.reply({"Hel", "lo"}, 1000, 280);

    Session session = f.engine.create("sonnet-4.5");
    std::vector<std::string> deltas;

    TurnResult result = f.engine.submit_turn(session, "  Hi there  ",
        [&](const std::string& d) { deltas.push_back(d); });

    REQUIRE(result.committed());
    REQUIRE(result.persisted());
    REQUIRE_FALSE(result.failure);
    REQUIRE(deltas == std::vector<std::string>{"Hel", "lo"});

    const Session& updated = *result.session;
    REQUIRE(updated.id == session.id);
    REQUIRE(updated.messages.size() == 2);
    REQUIRE(updated.messages[0] == Message{Role::User, "Hi there"});
    REQUIRE(updated.messages[1] == Message{Role::Assistant, "Hello"});

    REQUIRE(result.usage == TokenUsage{1000, 280});
    REQUIRE(result.incremental_cost == Approx(0.0072));
    REQUIRE(updated.total_cost == Approx(0.0072));

    REQUIRE(f.store.load(session.id) == updated);
    REQUIRE(f.engine.state_of(session.id) == TurnState::Idle);

    // The caller's value is untouched
    REQUIRE(session.messages.empty());
}

TEST_CASE("Request carries provider id, history and options", "[engine]") {
    Fixture f;
    f.transport.reply({"one"}, 10, 2);

    Session session = f.engine.create("sonnet-4.5");
    session = *f.engine.submit_turn(session, "first").session;

    f.transport.reply({"two"}, 20, 3);
    f.engine.submit_turn(session, "second");

    REQUIRE(f.transport.calls() == 2);
    const StreamRequest& request = f.transport.requests.back();
    REQUIRE(request.model == "claude-sonnet-4-5-20250929");
    REQUIRE(request.system_prompt == "Be brief.");
    REQUIRE(request.max_tokens == 4096);
    REQUIRE(request.messages.size() == 3);
    REQUIRE(request.messages[0] == Message{Role::User, "first"});
    REQUIRE(request.messages[1] == Message{Role::Assistant, "one"});
    REQUIRE(request.messages[2] == Message{Role::User, "second"});
}

TEST_CASE("Turns alternate and cost only grows", "[engine]") {
    Fixture f;
    Session session = f.engine.create("opus-4");

    double expected_total = 0.0;
    const int turns = 4;
    for (int i = 1; i <= turns; ++i) {
        f.transport.reply({"reply ", std::to_string(i)}, 100 * i, 20 * i);

        double before = session.total_cost;
        TurnResult result = f.engine.submit_turn(session, "question " + std::to_string(i));
        REQUIRE(result.committed());

        session = *result.session;
        expected_total += result.incremental_cost;
        REQUIRE(session.total_cost >= before);
        REQUIRE(session.total_cost == Approx(expected_total));
    }

    REQUIRE(session.messages.size() == 2 * turns);
    for (size_t i = 0; i < session.messages.size(); ++i) {
        REQUIRE(session.messages[i].role == (i % 2 == 0 ? Role::User : Role::Assistant));
    }
    REQUIRE(session.messages.back().content == "reply 4");
}

TEST_CASE("Rejected turns never reach the transport", "[engine]") {
    Fixture f;
    f.transport.reply({"x"}, 1, 1);
    Session session = f.engine.create("sonnet-4.5");

    SECTION("blank text") {
        REQUIRE_THROWS_AS(f.engine.submit_turn(session, " \n\t "), std::invalid_argument);
    }

    SECTION("transcript already ends with a user message") {
        session.messages.push_back({Role::User, "dangling"});
        REQUIRE_THROWS_AS(f.engine.submit_turn(session, "again"), OutOfOrderTurnError);
    }

    SECTION("model no longer in the table") {
        session.model = "retired-model";
        REQUIRE_THROWS_AS(f.engine.submit_turn(session, "hello"), UnknownModelError);
    }

    REQUIRE(f.transport.calls() == 0);
    REQUIRE_FALSE(f.store.exists(session.id));
}

TEST_CASE("Failed turn leaves the stored session unchanged", "[engine]") {
    Fixture f;
    f.transport.reply({"Hello"}, 10, 2);

    Session session = *f.engine.submit_turn(f.engine.create("sonnet-4.5"), "Hi").session;
    Session stored_before = f.store.load(session.id);

    SECTION("provider error mid-stream") {
        f.transport.script = {
            TextFragment{"partial "},
            TextFragment{"answer"},
            StreamError{FailureKind::ProviderError, "Overloaded"}
        };

        TurnResult result = f.engine.submit_turn(session, "Next");
        REQUIRE_FALSE(result.committed());
        REQUIRE(result.failure->kind == FailureKind::ProviderError);
        REQUIRE(result.failure->message == "Overloaded");
        REQUIRE(result.incremental_cost == 0.0);
    }

    SECTION("stream ends without a terminal marker") {
        f.transport.script = {TextFragment{"cut"}, UsageReport{{10, 1}}};

        TurnResult result = f.engine.submit_turn(session, "Next");
        REQUIRE_FALSE(result.committed());
        REQUIRE(result.failure->kind == FailureKind::ConnectionInterrupted);
    }

    REQUIRE(f.store.load(session.id) == stored_before);
    REQUIRE(f.engine.state_of(session.id) == TurnState::Idle);

    // The same session can take the next turn
    f.transport.reply({"Recovered"}, 12, 3);
    TurnResult retry = f.engine.submit_turn(session, "Next");
    REQUIRE(retry.committed());
    REQUIRE(retry.session->messages.size() == 4);
}

TEST_CASE("Cancelled turn commits nothing and leaves no temp file", "[engine]") {
    Fixture f;
    f.transport.reply({"Once ", "upon ", "a ", "time"}, 50, 10);

    std::atomic<bool> cancel{false};
    std::vector<std::string> deltas;

    Session session = f.engine.create("sonnet-4.5");
    TurnResult result = f.engine.submit_turn(
        session,
        "Tell me a story",
        [&](const std::string& d) {
            deltas.push_back(d);
            if (deltas.size() == 2) {
                cancel.store(true);
            }
        },
        [&]() { return cancel.load(); });

    REQUIRE_FALSE(result.committed());
    REQUIRE(result.failure->kind == FailureKind::Cancelled);
    REQUIRE(deltas == std::vector<std::string>{"Once ", "upon "});
    REQUIRE(f.dir.files().empty());
    REQUIRE(f.engine.state_of(session.id) == TurnState::Idle);
}

TEST_CASE("Cancellation is honoured even if the transport ignores it", "[engine]") {
    Fixture f;
    f.transport.reply({"a", "b"}, 5, 2);

    bool cancel = false;
    f.transport.before_event = [&](size_t index) {
        if (index == 2) {
            cancel = true;
        }
    };

    // Drops the cancel callback, so only the engine sees the flag
    struct IgnoringTransport : ITransport {
        ScriptedTransport& inner;
        explicit IgnoringTransport(ScriptedTransport& t) : inner(t) {}
        void stream(const StreamRequest& request, OnEventCallback on_event, CancelCallback) override {
            inner.stream(request, std::move(on_event), nullptr);
        }
        std::string get_name() const override { return "Ignoring"; }
    } ignoring(f.transport);

    SessionEngine engine(ignoring, f.store, f.pricing);
    TurnResult result = engine.submit_turn(engine.create("sonnet-4.5"), "hi", nullptr,
                                           [&]() { return cancel; });

    REQUIRE_FALSE(result.committed());
    REQUIRE(result.failure->kind == FailureKind::Cancelled);
}

TEST_CASE("Second turn on a busy session is rejected", "[engine]") {
    Fixture f;
    f.transport.reply({"slow"}, 10, 2);

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> release_future = release.get_future().share();
    f.transport.before_event = [&](size_t index) {
        if (index == 0) {
            entered.set_value();
            release_future.wait();
        }
    };

    Session session = f.engine.create("sonnet-4.5");
    std::future<TurnResult> first = std::async(std::launch::async, [&]() {
        return f.engine.submit_turn(session, "first");
    });

    entered.get_future().wait();
    REQUIRE(f.engine.state_of(session.id) == TurnState::AwaitingResponse);
    REQUIRE_THROWS_AS(f.engine.submit_turn(session, "second"), SessionBusyError);

    release.set_value();
    TurnResult result = first.get();

    REQUIRE(result.committed());
    REQUIRE(f.transport.calls() == 1);
    REQUIRE(f.engine.state_of(session.id) == TurnState::Idle);
}

TEST_CASE("Commit that cannot be saved is reported, not lost", "[engine]") {
    TempDir dir;
    {
        std::ofstream blocker(dir.path() / "blocked");
        blocker << "file where the directory should be";
    }

    ScriptedTransport transport;
    transport.reply({"Hello"}, 10, 2);
    PricingTable pricing;
    TranscriptStore store(dir.path() / "blocked");
    SessionEngine engine(transport, store, pricing);

    TurnResult result = engine.submit_turn(engine.create("sonnet-4.5"), "Hi");

    REQUIRE(result.committed());
    REQUIRE_FALSE(result.persisted());
    REQUIRE_FALSE(result.persist_error.empty());
    REQUIRE(result.session->messages.size() == 2);
}

TEST_CASE("Resume returns the committed session", "[engine]") {
    Fixture f;
    f.transport.reply({"Hello"}, 10, 2);

    Session committed = *f.engine.submit_turn(f.engine.create("sonnet-4"), "Hi").session;

    Session resumed = f.engine.resume(committed.id);
    REQUIRE(resumed == committed);

    f.transport.reply({"Again"}, 30, 4);
    TurnResult next = f.engine.submit_turn(resumed, "More");
    REQUIRE(next.session->messages.size() == 4);
    REQUIRE(next.session->total_cost > committed.total_cost);

    auto summaries = f.engine.list();
    REQUIRE(summaries.size() == 1);
    REQUIRE(summaries[0].id == committed.id);
    REQUIRE(summaries[0].message_count == 4);

    f.engine.remove(committed.id);
    REQUIRE_THROWS_AS(f.engine.resume(committed.id), SessionNotFoundError);
}

TEST_CASE("Turn states have stable names", "[engine]") {
    REQUIRE(turn_state_to_string(TurnState::Idle) == "idle");
    REQUIRE(turn_state_to_string(TurnState::AwaitingResponse) == "awaiting_response");
    REQUIRE(turn_state_to_string(TurnState::Committing) == "committing");
    REQUIRE(turn_state_to_string(TurnState::RollingBack) == "rolling_back");
}
