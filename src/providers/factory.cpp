#include "factory.hpp"
#include "anthropic/anthropic_transport.hpp"
#include "../config.hpp"
#include "../verbose.hpp"
#include <cstdlib>

namespace talk::providers {

std::unique_ptr<ITransport> TransportFactory::create(const TransportConfig& config) {
    if (config.api_key.empty()) {
        throw ProviderNotAvailableError("Anthropic API key is empty");
    }
    return std::make_unique<anthropic::AnthropicTransport>(config.api_key, config.api_base_url);
}

std::unique_ptr<ITransport> TransportFactory::create_from_environment(const std::string& base_url_override) {
    const char* api_key = std::getenv(ENV_API_KEY);
    if (!api_key || api_key[0] == '\0') {
        throw ProviderNotAvailableError(
            std::string("No API key found. Set the ") + ENV_API_KEY + " environment variable or add it to " + DOTENV_FILE + "."
        );
    }

    std::string base_url = base_url_override;
    if (base_url.empty()) {
        const char* env_base = std::getenv(ENV_BASE_URL);
        if (env_base) {
            base_url = env_base;
        }
    }
    if (!base_url.empty()) {
        verbose_log("CONFIG", "Using API base URL " + base_url);
    }

    return create({api_key, base_url});
}

} // namespace talk::providers
