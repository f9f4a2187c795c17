#pragma once

/**
 * Abstract interface for streaming completion transports.
 *
 * The session engine depends only on ITransport, so the real provider can be
 * swapped for a scripted one in tests.
 */

#include "types.hpp"
#include <string>

namespace talk::providers {

/**
 * Opens streamed exchanges with a remote model.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * Streams a completion for the given request.
     *
     * Every event is passed to on_event in arrival order. Failures of any
     * kind (connection setup, HTTP status, cancellation) are delivered as a
     * StreamError event rather than thrown. Exceptions raised by on_event
     * itself propagate to the caller after the connection is closed. The
     * call returns when the exchange is closed.
     */
    virtual void stream(
        const StreamRequest& request,
        OnEventCallback on_event,
        CancelCallback cancel_check = nullptr
    ) = 0;

    /**
     * Returns a human-readable provider name.
     */
    virtual std::string get_name() const = 0;
};

} // namespace talk::providers
