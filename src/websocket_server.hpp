#pragma once

/**
 * WebSocket server for real-time chat communication.
 *
 * Handles WebSocket connections from the browser page, runs conversation
 * turns through the session engine and streams replies back to clients.
 */

#include "session_engine.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace ix {
class WebSocket;
class WebSocketServer;
}

namespace talk {

/**
 * WebSocket server that runs conversation turns for web clients.
 *
 * Each connection holds at most one session. Messages are JSON objects:
 *   - Client sends: {"type": "new", "model": "..."}       start a session
 *   - Client sends: {"type": "resume", "id": "..."}       load a session
 *   - Client sends: {"type": "query", "content": "..."}   run a turn
 *   - Client sends: {"type": "cancel"}                    abandon the turn
 *   - Server sends: {"type": "session", "session": {...}}
 *   - Server sends: {"type": "delta", "content": "..."} for streaming
 *   - Server sends: {"type": "done", "session", "usage", "cost"} on commit
 *   - Server sends: {"type": "turn_failed", "reason", "message"} on rollback
 *   - Server sends: {"type": "error", "message": "..."} on error
 *
 * Turns run on a per-connection worker thread so that cancel messages and
 * disconnects are seen while the reply is streaming.
 */
class WebSocketServer {
public:
    explicit WebSocketServer(SessionEngine& engine);

    ~WebSocketServer();

    /**
     * Sets a callback to be invoked when the server starts listening.
     */
    void on_start(std::function<void(const std::string&, int)> callback);

    /**
     * Starts the WebSocket server.
     *
     * @param address The address to bind to (e.g., "0.0.0.0")
     * @param port The port to listen on
     * @return true if the server started successfully
     */
    bool start(const std::string& address, int port);

    /**
     * Stops the WebSocket server, cancelling turns in flight.
     */
    void stop();

private:
    // State of one client connection.
    struct Connection {
        std::mutex mutex;
        std::optional<Session> session;
        std::atomic<bool> busy{false};
        std::atomic<bool> cancel{false};
        std::thread worker;
    };

    SessionEngine& engine_;

    std::unique_ptr<ix::WebSocketServer> server_;
    std::function<void(const std::string&, int)> on_start_callback_;

    std::mutex connections_mutex_;
    std::unordered_map<void*, std::shared_ptr<Connection>> connections_;

    // Handles an incoming message from a client
    void handle_message(Connection& conn, ix::WebSocket& ws, const std::string& message);

    void handle_new(Connection& conn, ix::WebSocket& ws, const std::string& model);
    void handle_resume(Connection& conn, ix::WebSocket& ws, const std::string& id);

    // Starts a turn on the connection's worker thread
    void handle_query(Connection& conn, ix::WebSocket& ws, const std::string& content);

    // Runs one turn and reports the outcome. Called on the worker thread.
    void run_turn(Connection& conn, ix::WebSocket& ws, Session session, const std::string& content);

    // Cancels and joins the connection's worker.
    static void finish_worker(Connection& conn);

    // Sends a JSON message to a client
    void send_json(ix::WebSocket& ws, const nlohmann::json& msg);
    void send_error(ix::WebSocket& ws, const std::string& message);
};

} // namespace talk
