#include "websocket_server.hpp"
#include "errors.hpp"
#include "transcript_store.hpp"
#include "verbose.hpp"
#include <ixwebsocket/IXWebSocketServer.h>
#include <iostream>

namespace talk {

using json = nlohmann::json;

WebSocketServer::WebSocketServer(SessionEngine& engine) : engine_(engine) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::on_start(std::function<void(const std::string&, int)> callback) {
    on_start_callback_ = std::move(callback);
}

bool WebSocketServer::start(const std::string& address, int port) {
    server_ = std::make_unique<ix::WebSocketServer>(port, address);

    server_->setOnClientMessageCallback(
        [this](std::shared_ptr<ix::ConnectionState> connectionState,
               ix::WebSocket& webSocket,
               const ix::WebSocketMessagePtr& msg) {

            void* conn_id = connectionState.get();

            if (msg->type == ix::WebSocketMessageType::Open) {
                verbose_log("WS", "Client connected: " + connectionState->getRemoteIp());
                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections_[conn_id] = std::make_shared<Connection>();
            }
            else if (msg->type == ix::WebSocketMessageType::Close) {
                verbose_log("WS", "Client disconnected: " + connectionState->getRemoteIp());
                std::shared_ptr<Connection> conn;
                {
                    std::lock_guard<std::mutex> lock(connections_mutex_);
                    auto it = connections_.find(conn_id);
                    if (it != connections_.end()) {
                        conn = it->second;
                        connections_.erase(it);
                    }
                }
                // The worker holds a reference to webSocket; it must finish first
                if (conn) {
                    finish_worker(*conn);
                }
            }
            else if (msg->type == ix::WebSocketMessageType::Message) {
                verbose_in("WS", "Message: " + truncate(msg->str, 500));
                std::shared_ptr<Connection> conn;
                {
                    std::lock_guard<std::mutex> lock(connections_mutex_);
                    auto it = connections_.find(conn_id);
                    if (it != connections_.end()) {
                        conn = it->second;
                    }
                }
                if (conn) {
                    handle_message(*conn, webSocket, msg->str);
                }
            }
            else if (msg->type == ix::WebSocketMessageType::Error) {
                // Ignore "Could not parse url" errors - these are typically from
                // non-WebSocket requests (like browser pre-flight checks)
                if (msg->errorInfo.reason.find("Could not parse url") == std::string::npos) {
                    verbose_err("WS", "Error: " + msg->errorInfo.reason);
                    std::cerr << "WebSocket error: " << msg->errorInfo.reason << std::endl;
                }
            }
        }
    );

    auto result = server_->listen();
    if (!result.first) {
        std::cerr << "WebSocket server failed to listen: " << result.second << std::endl;
        return false;
    }

    if (on_start_callback_) {
        on_start_callback_(address, port);
    }

    server_->start();
    return true;
}

void WebSocketServer::stop() {
    std::unordered_map<void*, std::shared_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        remaining.swap(connections_);
    }
    // Workers reference their connection's socket, so they finish before the server closes it
    for (auto& entry : remaining) {
        finish_worker(*entry.second);
    }

    if (server_) {
        server_->stop();
        server_.reset();
    }
}

void WebSocketServer::finish_worker(Connection& conn) {
    conn.cancel.store(true);
    if (conn.worker.joinable()) {
        conn.worker.join();
    }
}

void WebSocketServer::handle_message(Connection& conn, ix::WebSocket& ws, const std::string& message) {
    try {
        auto msg = json::parse(message);
        std::string type = msg.value("type", "");

        if (type == "cancel") {
            if (conn.busy.load()) {
                verbose_log("WS", "Cancel requested");
                conn.cancel.store(true);
            }
            return;
        }

        if (conn.busy.load()) {
            send_error(ws, "A reply is still streaming");
            return;
        }

        if (type == "new") {
            handle_new(conn, ws, msg.value("model", ""));
        } else if (type == "resume") {
            handle_resume(conn, ws, msg.value("id", ""));
        } else if (type == "query") {
            handle_query(conn, ws, msg.value("content", ""));
        } else {
            send_error(ws, "Unknown message type");
        }

    } catch (const json::exception&) {
        send_error(ws, "Invalid JSON");
    }
}

void WebSocketServer::handle_new(Connection& conn, ix::WebSocket& ws, const std::string& model) {
    try {
        Session session = engine_.create(model.empty() ? engine_.pricing().default_model().key : model);
        {
            std::lock_guard<std::mutex> lock(conn.mutex);
            conn.session = session;
        }
        send_json(ws, {{"type", "session"}, {"session", session_to_json(session)}});
    } catch (const UnknownModelError& e) {
        send_error(ws, e.what());
    }
}

void WebSocketServer::handle_resume(Connection& conn, ix::WebSocket& ws, const std::string& id) {
    try {
        Session session = engine_.resume(id);
        {
            std::lock_guard<std::mutex> lock(conn.mutex);
            conn.session = session;
        }
        send_json(ws, {{"type", "session"}, {"session", session_to_json(session)}});
    } catch (const SessionNotFoundError& e) {
        send_error(ws, e.what());
    } catch (const PersistenceError& e) {
        send_error(ws, e.what());
    }
}

void WebSocketServer::handle_query(Connection& conn, ix::WebSocket& ws, const std::string& content) {
    if (trim(content).empty()) {
        send_error(ws, "Empty query");
        return;
    }

    Session session;
    {
        std::lock_guard<std::mutex> lock(conn.mutex);
        if (!conn.session) {
            send_error(ws, "No session. Send \"new\" or \"resume\" first");
            return;
        }
        session = *conn.session;
    }

    // Previous worker is done or only sending its final message; reap it
    if (conn.worker.joinable()) {
        conn.worker.join();
    }

    conn.cancel.store(false);
    conn.busy.store(true);
    conn.worker = std::thread(&WebSocketServer::run_turn, this,
                              std::ref(conn), std::ref(ws), std::move(session), content);
}

void WebSocketServer::run_turn(Connection& conn, ix::WebSocket& ws, Session session, const std::string& content) {
    verbose_log("WS", "Turn on " + session.id + ": " + truncate(content, 100));

    json reply;
    try {
        TurnResult result = engine_.submit_turn(
            session,
            content,
            [this, &ws](const std::string& delta) {
                send_json(ws, {{"type", "delta"}, {"content", delta}});
            },
            [&conn]() { return conn.cancel.load(); }
        );

        if (result.committed()) {
            {
                std::lock_guard<std::mutex> lock(conn.mutex);
                conn.session = *result.session;
            }
            reply = {
                {"type", "done"},
                {"session", session_to_json(*result.session)},
                {"usage", {
                    {"input_tokens", result.usage.input_tokens},
                    {"output_tokens", result.usage.output_tokens}
                }},
                {"cost", result.incremental_cost},
                {"persisted", result.persisted()}
            };
            if (!result.persisted()) {
                reply["persist_error"] = result.persist_error;
            }
        } else {
            reply = {
                {"type", "turn_failed"},
                {"reason", providers::failure_kind_to_string(result.failure->kind)},
                {"message", result.failure->message}
            };
        }
    } catch (const std::exception& e) {
        // Rejected preconditions (out-of-order, busy, unknown model) land here too
        verbose_err("WS", std::string("Turn failed: ") + e.what());
        reply = {{"type", "error"}, {"message", e.what()}};
    }

    // The client may send its next query as soon as the final message arrives
    conn.busy.store(false);
    send_json(ws, reply);
}

void WebSocketServer::send_json(ix::WebSocket& ws, const json& msg) {
    std::string msg_str = msg.dump();
    verbose_out("WS", "Send: " + truncate(msg_str, 500));
    ws.send(msg_str);
}

void WebSocketServer::send_error(ix::WebSocket& ws, const std::string& message) {
    send_json(ws, {{"type", "error"}, {"message", message}});
}

} // namespace talk
