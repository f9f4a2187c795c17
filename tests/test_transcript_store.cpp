#include <catch2/catch.hpp>
#include "errors.hpp"
#include "test_helpers.hpp"
#include "transcript_store.hpp"
#include <fstream>

using namespace talk;
using talk::testing::TempDir;

namespace {

Session make_session(const std::string& id, TimePoint created_at) {
    Session session;
    session.id = id;
    session.created_at = created_at;
    session.model = "sonnet-4.5";
    session.messages = {
        {Role::User, "What is RAII?\nPlease keep it short."},
        {Role::Assistant, "Resource Acquisition Is Initialization."}
    };
    session.total_cost = 0.0123456789;
    return session;
}

TimePoint at(int64_t millis) {
    return TimePoint(std::chrono::milliseconds(millis));
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

} // namespace

TEST_CASE("Saved session loads back equal", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path());

    Session session = make_session("20250131_091502_00ff", at(1738314902123));
    store.save(session);

    Session loaded = store.load(session.id);
    REQUIRE(loaded == session);
    REQUIRE(loaded.total_cost == session.total_cost);
    REQUIRE(loaded.created_at == session.created_at);
}

TEST_CASE("Save leaves only the final record behind", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path());

    Session session = make_session("abc", at(1000));
    store.save(session);
    session.messages.push_back({Role::User, "More"});
    session.messages.push_back({Role::Assistant, "Sure"});
    store.save(session);

    REQUIRE(dir.files() == std::vector<std::string>{"abc.json"});
    REQUIRE(store.load("abc").messages.size() == 4);
}

TEST_CASE("Record format uses ISO timestamps and role names", "[store]") {
    Session session = make_session("abc", at(1738314902123));
    auto j = session_to_json(session);

    REQUIRE(j["id"] == "abc");
    REQUIRE(j["created_at"] == "2025-01-31T09:15:02.123Z");
    REQUIRE(j["model"] == "sonnet-4.5");
    REQUIRE(j["messages"][0]["role"] == "user");
    REQUIRE(j["messages"][1]["role"] == "assistant");
    REQUIRE(j["total_cost"].get<double>() == session.total_cost);

    REQUIRE(session_from_json(j) == session);
}

TEST_CASE("Missing session is reported as not found", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path());

    REQUIRE_FALSE(store.exists("nope"));
    REQUIRE_THROWS_AS(store.load("nope"), SessionNotFoundError);
    REQUIRE_THROWS_AS(store.remove("nope"), SessionNotFoundError);

    // Path-like ids never reach the filesystem
    REQUIRE_THROWS_AS(store.load("../etc/passwd"), SessionNotFoundError);
}

TEST_CASE("Corrupt records raise PersistenceError", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path());

    SECTION("not JSON") {
        write_file(dir.path() / "bad.json", "{ truncated");
        REQUIRE_THROWS_AS(store.load("bad"), PersistenceError);
    }

    SECTION("missing fields") {
        write_file(dir.path() / "bad.json", R"({"id":"bad","model":"sonnet-4.5"})");
        REQUIRE_THROWS_AS(store.load("bad"), PersistenceError);
    }

    SECTION("unknown role") {
        write_file(dir.path() / "bad.json",
                   R"({"id":"bad","created_at":"2025-01-31T09:15:02.000Z","model":"sonnet-4.5",)"
                   R"("messages":[{"role":"system","content":"x"}],"total_cost":0})");
        REQUIRE_THROWS_AS(store.load("bad"), PersistenceError);
    }
}

TEST_CASE("Invalid id cannot be saved", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path());

    Session session = make_session("a/b", at(0));
    REQUIRE_THROWS_AS(store.save(session), PersistenceError);
    REQUIRE(dir.files().empty());
}

TEST_CASE("Listing is newest first with first-user-message previews", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path());

    Session older = make_session("older", at(1000));
    Session newer = make_session("newer", at(5000));
    newer.messages[0].content = std::string(80, 'x');
    Session empty = make_session("empty", at(3000));
    empty.messages.clear();
    empty.total_cost = 0.0;

    store.save(older);
    store.save(newer);
    store.save(empty);
    write_file(dir.path() / "broken.json", "not json");
    write_file(dir.path() / "notes.txt", "ignored");

    auto summaries = store.list();
    REQUIRE(summaries.size() == 3);

    REQUIRE(summaries[0].id == "newer");
    REQUIRE(summaries[0].preview == std::string(60, 'x') + "...");
    REQUIRE(summaries[0].message_count == 2);

    REQUIRE(summaries[1].id == "empty");
    REQUIRE(summaries[1].preview == "New conversation");
    REQUIRE(summaries[1].message_count == 0);

    REQUIRE(summaries[2].id == "older");
    REQUIRE(summaries[2].preview == "What is RAII?");
    REQUIRE(summaries[2].total_cost == older.total_cost);
}

TEST_CASE("Preview cut never splits a multi-byte character", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path());

    // "é" is two bytes and straddles byte 60
    Session session = make_session("accented", at(1000));
    session.messages[0].content = std::string(59, 'a') + "\xC3\xA9 and more text";
    store.save(session);

    auto summaries = store.list();
    REQUIRE(summaries.size() == 1);
    REQUIRE(summaries[0].preview == std::string(59, 'a') + "\xC3\xA9...");
    REQUIRE_NOTHROW(nlohmann::json{{"preview", summaries[0].preview}}.dump());

    REQUIRE(make_preview("\xE4\xB8\x96\xE7\x95\x8C\xE4\xBD\xA0\xE5\xA5\xBD", 2) ==
            "\xE4\xB8\x96\xE7\x95\x8C...");
    REQUIRE(make_preview("caf\xC3\xA9", 4) == "caf\xC3\xA9");
}

TEST_CASE("Remove deletes the record", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path());

    store.save(make_session("gone", at(0)));
    REQUIRE(store.exists("gone"));

    store.remove("gone");
    REQUIRE_FALSE(store.exists("gone"));
    REQUIRE(store.list().empty());
}

TEST_CASE("Directory is created on first use", "[store]") {
    TempDir dir;
    TranscriptStore store(dir.path() / "nested" / "conversations");

    REQUIRE(store.list().empty());
    store.save(make_session("first", at(0)));
    REQUIRE(std::filesystem::exists(dir.path() / "nested" / "conversations" / "first.json"));
}

TEST_CASE("Unwritable directory raises PersistenceError", "[store]") {
    TempDir dir;
    write_file(dir.path() / "occupied", "a file, not a directory");
    TranscriptStore store(dir.path() / "occupied");

    REQUIRE_THROWS_AS(store.save(make_session("x", at(0))), PersistenceError);
}

TEST_CASE("Timestamps round-trip at millisecond precision", "[store]") {
    TimePoint tp = at(1738314902007);
    REQUIRE(format_timestamp(tp) == "2025-01-31T09:15:02.007Z");
    REQUIRE(parse_timestamp(format_timestamp(tp)) == tp);
    REQUIRE(parse_timestamp("2025-01-31T09:15:02Z") == at(1738314902000));
    REQUIRE_THROWS_AS(parse_timestamp("yesterday"), std::invalid_argument);
}
