#pragma once

/**
 * HTTP server for the browser surface.
 *
 * Serves static files from a www directory and a small REST API over the
 * stored conversations and the model table:
 *
 *   GET    /api/models           Models with their rates
 *   GET    /api/sessions         Conversation summaries, most recent first
 *   GET    /api/sessions/<id>    One full conversation
 *   DELETE /api/sessions/<id>    Delete a conversation
 */

#include <string>
#include <functional>

namespace talk {

class SessionEngine;

class HttpServer {
public:
    // Serves the API over engine and static files from www_dir.
    HttpServer(SessionEngine& engine, std::string www_dir);

    // Starts the server on the given address and port.
    // This call blocks until the server is stopped.
    // Returns true if the server ran, false if it could not bind.
    bool start(const std::string& address, int port);

    // Sets a callback to be called when the server starts.
    void on_start(std::function<void(const std::string&, int)> callback);

private:
    SessionEngine& engine_;
    std::string www_dir_;
    std::function<void(const std::string&, int)> on_start_callback_;
};

} // namespace talk
