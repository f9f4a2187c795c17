#pragma once

/**
 * Factory for creating streaming transports.
 */

#include "provider.hpp"
#include <memory>
#include <stdexcept>
#include <string>

namespace talk::providers {

/**
 * Configuration for creating a transport instance.
 */
struct TransportConfig {
    std::string api_key;
    std::string api_base_url;  // Optional base URL override
};

/**
 * Exception thrown when no transport can be configured.
 */
class ProviderNotAvailableError : public std::runtime_error {
public:
    explicit ProviderNotAvailableError(const std::string& message)
        : std::runtime_error(message) {}
};

class TransportFactory {
public:
    /**
     * Creates a transport from explicit configuration.
     * Throws ProviderNotAvailableError if the API key is empty.
     */
    static std::unique_ptr<ITransport> create(const TransportConfig& config);

    /**
     * Creates a transport from ANTHROPIC_API_KEY and, if set,
     * ANTHROPIC_BASE_URL. A non-empty base_url_override wins over the
     * environment.
     * Throws ProviderNotAvailableError if no API key is found.
     */
    static std::unique_ptr<ITransport> create_from_environment(const std::string& base_url_override = "");
};

} // namespace talk::providers
