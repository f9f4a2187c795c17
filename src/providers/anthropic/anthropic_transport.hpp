#pragma once

/**
 * Anthropic Messages API transport.
 *
 * Posts the conversation to /v1/messages with "stream": true and turns the
 * server-sent events into StreamEvents using libcurl for HTTP transport.
 */

#include "../provider.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace talk::providers::anthropic {

class AnthropicTransport : public ITransport {
public:
    /**
     * Creates a transport with the given API key.
     * @param api_key The Anthropic API key.
     * @param api_base_url Optional base URL override (defaults to ANTHROPIC_API_BASE).
     */
    AnthropicTransport(const std::string& api_key, const std::string& api_base_url = "");
    ~AnthropicTransport() override;

    // Prevent copying
    AnthropicTransport(const AnthropicTransport&) = delete;
    AnthropicTransport& operator=(const AnthropicTransport&) = delete;

    void stream(
        const StreamRequest& request,
        OnEventCallback on_event,
        CancelCallback cancel_check = nullptr
    ) override;

    std::string get_name() const override { return "Anthropic"; }

    // Request body for a streamed completion.
    static nlohmann::json build_body(const StreamRequest& request);

    // build_body as sent on the wire. Never throws on invalid UTF-8.
    static std::string serialize_body(const StreamRequest& request);

private:
    std::string api_key_;
    std::string api_base_;
};

} // namespace talk::providers::anthropic
