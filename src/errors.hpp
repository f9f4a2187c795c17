#pragma once

/**
 * Exception types raised by the session engine and its collaborators.
 *
 * Failed turns are not exceptions: they come back as a TurnFailure inside
 * TurnResult. Everything here is a precondition or storage failure that the
 * immediate caller is expected to handle.
 */

#include <stdexcept>
#include <string>

namespace talk {

/**
 * Model key is not present in the pricing table.
 */
class UnknownModelError : public std::runtime_error {
public:
    explicit UnknownModelError(const std::string& model)
        : std::runtime_error("Unknown model: " + model), model_(model) {}

    const std::string& model() const { return model_; }

private:
    std::string model_;
};

/**
 * A user turn was submitted while the transcript already ends with a user turn.
 */
class OutOfOrderTurnError : public std::runtime_error {
public:
    explicit OutOfOrderTurnError(const std::string& session_id)
        : std::runtime_error("Session " + session_id +
                             " is waiting for an assistant reply; user turns must alternate") {}
};

/**
 * A turn is already in flight for this session.
 */
class SessionBusyError : public std::runtime_error {
public:
    explicit SessionBusyError(const std::string& session_id)
        : std::runtime_error("Session " + session_id + " already has a turn in flight") {}
};

/**
 * No persisted record exists for the requested session id.
 */
class SessionNotFoundError : public std::runtime_error {
public:
    explicit SessionNotFoundError(const std::string& session_id)
        : std::runtime_error("Conversation not found: " + session_id), session_id_(session_id) {}

    const std::string& session_id() const { return session_id_; }

private:
    std::string session_id_;
};

/**
 * Reading or writing a transcript record failed.
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Settings file exists but cannot be used.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace talk
