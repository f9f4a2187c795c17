#include <catch2/catch.hpp>
#include "providers/anthropic/anthropic_transport.hpp"
#include "providers/anthropic/sse_parser.hpp"
#include <string>
#include <vector>

using namespace talk;
using namespace talk::providers;
using namespace talk::providers::anthropic;

namespace {

// A complete streamed reply as the Messages API sends it.
const char* const kHelloStream =
    "event: message_start\n"
    "data: {\"type\":\"message_start\",\"message\":{\"id\":\"msg_1\",\"role\":\"assistant\","
    "\"usage\":{\"input_tokens\":10,\"output_tokens\":1}}}\n"
    "\n"
    "event: content_block_start\n"
    "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"text\",\"text\":\"\"}}\n"
    "\n"
    "event: ping\n"
    "data: {\"type\":\"ping\"}\n"
    "\n"
    "event: content_block_delta\n"
    "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"Hel\"}}\n"
    "\n"
    "event: content_block_delta\n"
    "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"lo\"}}\n"
    "\n"
    "event: content_block_stop\n"
    "data: {\"type\":\"content_block_stop\",\"index\":0}\n"
    "\n"
    "event: message_delta\n"
    "data: {\"type\":\"message_delta\",\"delta\":{\"stop_reason\":\"end_turn\"},\"usage\":{\"output_tokens\":2}}\n"
    "\n"
    "event: message_stop\n"
    "data: {\"type\":\"message_stop\"}\n"
    "\n";

struct Collected {
    std::string text;
    std::vector<TokenUsage> usage;
    int successes = 0;
    std::vector<StreamError> errors;
};

OnEventCallback collect_into(Collected& out) {
    return [&out](const StreamEvent& event) {
        if (auto* fragment = std::get_if<TextFragment>(&event)) {
            out.text += fragment->text;
        } else if (auto* report = std::get_if<UsageReport>(&event)) {
            out.usage.push_back(report->usage);
        } else if (std::holds_alternative<StreamSuccess>(event)) {
            ++out.successes;
        } else if (auto* error = std::get_if<StreamError>(&event)) {
            out.errors.push_back(*error);
        }
    };
}

} // namespace

TEST_CASE("Complete stream yields text, merged usage and success", "[sse]") {
    Collected out;
    SseParser parser(collect_into(out));

    parser.feed(kHelloStream);
    parser.flush();

    REQUIRE(out.text == "Hello");
    REQUIRE(out.successes == 1);
    REQUIRE(out.errors.empty());
    REQUIRE(parser.saw_terminal());

    REQUIRE(out.usage.size() == 2);
    REQUIRE(out.usage.front() == TokenUsage{10, 1});
    REQUIRE(out.usage.back() == TokenUsage{10, 2});
}

TEST_CASE("Chunk boundaries do not matter", "[sse]") {
    const std::string stream = kHelloStream;

    for (size_t chunk : {1u, 3u, 7u, 64u}) {
        Collected out;
        SseParser parser(collect_into(out));

        for (size_t pos = 0; pos < stream.size(); pos += chunk) {
            std::string piece = stream.substr(pos, chunk);
            parser.feed(piece.data(), piece.size());
        }
        parser.flush();

        INFO("chunk size " << chunk);
        REQUIRE(out.text == "Hello");
        REQUIRE(out.successes == 1);
        REQUIRE(out.usage.back() == TokenUsage{10, 2});
    }
}

TEST_CASE("CRLF line endings are accepted", "[sse]") {
    Collected out;
    SseParser parser(collect_into(out));

    parser.feed("data: {\"type\":\"content_block_delta\",\"delta\":{\"type\":\"text_delta\",\"text\":\"Hi\"}}\r\n\r\n");
    parser.feed("data: {\"type\":\"message_stop\"}\r\n\r\n");

    REQUIRE(out.text == "Hi");
    REQUIRE(out.successes == 1);
}

TEST_CASE("Trailing line without newline is processed on flush", "[sse]") {
    Collected out;
    SseParser parser(collect_into(out));

    parser.feed("data: {\"type\":\"message_stop\"}");
    REQUIRE(out.successes == 0);

    parser.flush();
    REQUIRE(out.successes == 1);
}

TEST_CASE("Error event becomes a provider error", "[sse]") {
    Collected out;
    SseParser parser(collect_into(out));

    parser.feed("event: error\n"
                "data: {\"type\":\"error\",\"error\":{\"type\":\"overloaded_error\",\"message\":\"Overloaded\"}}\n\n");

    REQUIRE(out.errors.size() == 1);
    REQUIRE(out.errors[0].kind == FailureKind::ProviderError);
    REQUIRE(out.errors[0].message == "Overloaded");
    REQUIRE(parser.saw_terminal());
}

TEST_CASE("Malformed and non-text events are skipped", "[sse]") {
    Collected out;
    SseParser parser(collect_into(out));

    parser.feed("data: {not json\n\n");
    parser.feed(": comment line\n");
    parser.feed("data: {\"type\":\"content_block_delta\",\"delta\":{\"type\":\"input_json_delta\",\"partial_json\":\"{}\"}}\n\n");
    parser.feed("data: {\"type\":\"content_block_delta\",\"delta\":{\"type\":\"text_delta\",\"text\":\"ok\"}}\n\n");

    REQUIRE(out.text == "ok");
    REQUIRE(out.errors.empty());
    REQUIRE_FALSE(parser.saw_terminal());
}

TEST_CASE("Stream cut before message_stop has no terminal marker", "[sse]") {
    Collected out;
    SseParser parser(collect_into(out));

    std::string stream = kHelloStream;
    parser.feed(stream.substr(0, stream.find("event: message_delta")));
    parser.flush();

    REQUIRE(out.text == "Hello");
    REQUIRE(out.successes == 0);
    REQUIRE_FALSE(parser.saw_terminal());
}

TEST_CASE("Raw prefix keeps the start of a non-SSE body", "[sse]") {
    Collected out;
    SseParser parser(collect_into(out));

    std::string body = R"({"type":"error","error":{"type":"authentication_error","message":"invalid x-api-key"}})";
    parser.feed(body);

    REQUIRE(parser.raw_prefix() == body);
    REQUIRE(SseParser::error_message_from_body(parser.raw_prefix(), "HTTP 401") == "invalid x-api-key");
    REQUIRE(SseParser::error_message_from_body("<html>Bad Gateway</html>", "HTTP 502") == "HTTP 502");
}

TEST_CASE("Request body carries model, history and stream flag", "[sse]") {
    StreamRequest request;
    request.model = "claude-sonnet-4-5-20250929";
    request.messages = {{Role::User, "Hi"}, {Role::Assistant, "Hello"}, {Role::User, "Again"}};
    request.max_tokens = 8000;

    SECTION("without system prompt") {
        auto body = AnthropicTransport::build_body(request);

        REQUIRE(body["model"] == "claude-sonnet-4-5-20250929");
        REQUIRE(body["max_tokens"] == 8000);
        REQUIRE(body["stream"] == true);
        REQUIRE(body["messages"].size() == 3);
        REQUIRE(body["messages"][0]["role"] == "user");
        REQUIRE(body["messages"][1]["role"] == "assistant");
        REQUIRE(body["messages"][2]["content"] == "Again");
        REQUIRE_FALSE(body.contains("system"));
    }

    SECTION("with system prompt") {
        request.system_prompt = "Be brief.";
        auto body = AnthropicTransport::build_body(request);
        REQUIRE(body["system"] == "Be brief.");
    }
}

TEST_CASE("Request body with invalid UTF-8 is sent with replacement characters", "[sse]") {
    StreamRequest request;
    request.model = "claude-sonnet-4-5-20250929";
    request.messages = {{Role::User, "caf\xe9"}};

    std::string body;
    REQUIRE_NOTHROW(body = AnthropicTransport::serialize_body(request));
    REQUIRE(body.find("caf\xEF\xBF\xBD") != std::string::npos);
    REQUIRE(nlohmann::json::parse(body)["messages"][0]["content"] == "caf\xEF\xBF\xBD");
}

TEST_CASE("Transport reports failures as events, not exceptions", "[sse]") {
    // Nothing listens on port 1, so the request fails at connect
    AnthropicTransport transport("test-key", "http://127.0.0.1:1");

    StreamRequest request;
    request.model = "claude-sonnet-4-5-20250929";
    request.messages = {{Role::User, "caf\xe9"}};

    Collected out;
    REQUIRE_NOTHROW(transport.stream(request, collect_into(out)));
    REQUIRE(out.errors.size() == 1);
    REQUIRE(out.errors[0].kind == FailureKind::ConnectionInterrupted);
    REQUIRE(out.successes == 0);
}
