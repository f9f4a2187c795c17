#include "anthropic_transport.hpp"
#include "sse_parser.hpp"
#include "../../config.hpp"
#include "../../verbose.hpp"
#include <curl/curl.h>
#include <exception>

namespace talk::providers::anthropic {

using json = nlohmann::json;

// Context shared with the CURL callbacks for one streamed request.
struct StreamContext {
    SseParser parser;
    CancelCallback cancel_check;
    bool cancelled = false;
    std::exception_ptr callback_error;  // Exceptions must not unwind through libcurl
};

// CURL progress callback for cancellation support.
static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->cancel_check && ctx->cancel_check()) {
        ctx->cancelled = true;
        return 1;
    }
    return 0;
}

// CURL write callback for streaming SSE data.
static size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    size_t total_size = size * nmemb;

    if (ctx->cancel_check && ctx->cancel_check()) {
        ctx->cancelled = true;
        return 0;
    }

    try {
        ctx->parser.feed(ptr, total_size);
    } catch (...) {
        ctx->callback_error = std::current_exception();
        return 0;
    }
    return total_size;
}

AnthropicTransport::AnthropicTransport(const std::string& api_key, const std::string& api_base_url)
    : api_key_(api_key)
    , api_base_(api_base_url.empty() ? ANTHROPIC_API_BASE : api_base_url) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

AnthropicTransport::~AnthropicTransport() {
    curl_global_cleanup();
}

json AnthropicTransport::build_body(const StreamRequest& request) {
    json messages = json::array();
    for (const auto& msg : request.messages) {
        messages.push_back(msg.to_json());
    }

    json body = {
        {"model", request.model},
        {"max_tokens", request.max_tokens},
        {"messages", messages},
        {"stream", true}
    };

    if (!request.system_prompt.empty()) {
        body["system"] = request.system_prompt;
    }
    return body;
}

std::string AnthropicTransport::serialize_body(const StreamRequest& request) {
    // Text that is not valid UTF-8 (e.g. Latin-1 terminal input) is sent with U+FFFD
    return build_body(request).dump(-1, ' ', false, json::error_handler_t::replace);
}

void AnthropicTransport::stream(const StreamRequest& request,
                                OnEventCallback on_event,
                                CancelCallback cancel_check) {
    std::string url = api_base_ + "/v1/messages";
    std::string body_str = serialize_body(request);
    verbose_out("CURL", "POST (stream) " + url);
    verbose_out("CURL", "Body: " + format_json_compact(body_str, 1000));

    CURL* curl = curl_easy_init();
    if (!curl) {
        verbose_err("CURL", "Failed to initialize CURL");
        on_event(StreamError{FailureKind::ConnectionInterrupted, "Failed to initialize CURL"});
        return;
    }

    StreamContext ctx{SseParser(on_event), cancel_check, false, nullptr};

    struct curl_slist* headers = nullptr;
    std::string key_header = "x-api-key: " + api_key_;
    std::string version_header = std::string("anthropic-version: ") + ANTHROPIC_VERSION;
    headers = curl_slist_append(headers, key_header.c_str());
    headers = curl_slist_append(headers, version_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: text/event-stream");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    if (cancel_check) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    }

    if (is_verbose()) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    verbose_log("CURL", "Starting streaming request...");
    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (ctx.callback_error) {
        std::rethrow_exception(ctx.callback_error);
    }

    if (ctx.cancelled || res == CURLE_ABORTED_BY_CALLBACK) {
        verbose_log("CURL", "Stream cancelled by caller");
        on_event(StreamError{FailureKind::Cancelled, "Cancelled"});
        return;
    }

    if (res != CURLE_OK) {
        verbose_err("CURL", std::string("Streaming POST failed: ") + curl_easy_strerror(res));
        on_event(StreamError{FailureKind::ConnectionInterrupted,
                             std::string("HTTP streaming POST failed: ") + curl_easy_strerror(res)});
        return;
    }

    if (http_code >= 400) {
        std::string fallback = "HTTP " + std::to_string(http_code);
        std::string message = SseParser::error_message_from_body(ctx.parser.raw_prefix(), fallback);
        verbose_err("CURL", "HTTP " + std::to_string(http_code) + " - " + truncate(ctx.parser.raw_prefix(), 500));
        if (message != fallback) {
            message = fallback + ": " + message;
        }
        on_event(StreamError{FailureKind::ProviderError, message});
        return;
    }

    ctx.parser.flush();
    verbose_in("CURL", "Stream complete, HTTP " + std::to_string(http_code));
}

} // namespace talk::providers::anthropic
