#include "http_server.hpp"
#include "errors.hpp"
#include "session_engine.hpp"
#include "transcript_store.hpp"
#include "verbose.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace talk {

static void send_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}

static json summary_to_json(const SessionSummary& summary) {
    return {
        {"id", summary.id},
        {"created_at", format_timestamp(summary.created_at)},
        {"model", summary.model},
        {"preview", summary.preview},
        {"total_cost", summary.total_cost},
        {"message_count", summary.message_count}
    };
}

HttpServer::HttpServer(SessionEngine& engine, std::string www_dir)
    : engine_(engine), www_dir_(std::move(www_dir)) {}

bool HttpServer::start(const std::string& address, int port) {
    httplib::Server svr;

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        verbose_log("HTTP", req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    // REST API: Model table
    svr.Get("/api/models", [this](const httplib::Request&, httplib::Response& res) {
        const PricingTable& pricing = engine_.pricing();
        const std::string default_key = pricing.default_model().key;

        json models = json::array();
        for (const auto& spec : pricing.models()) {
            models.push_back({
                {"key", spec.key},
                {"id", spec.provider_id},
                {"name", spec.display_name},
                {"input_per_mtok", spec.rate.input_per_mtok},
                {"output_per_mtok", spec.rate.output_per_mtok},
                {"default", spec.key == default_key}
            });
        }
        res.set_content(models.dump(), "application/json");
    });

    // REST API: Conversation list
    svr.Get("/api/sessions", [this](const httplib::Request&, httplib::Response& res) {
        json sessions = json::array();
        for (const auto& summary : engine_.list()) {
            sessions.push_back(summary_to_json(summary));
        }
        res.set_content(sessions.dump(), "application/json");
    });

    // REST API: Single conversation
    svr.Get(R"(/api/sessions/([A-Za-z0-9_-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            Session session = engine_.resume(req.matches[1]);
            res.set_content(session_to_json(session).dump(), "application/json");
        } catch (const SessionNotFoundError& e) {
            send_error(res, 404, e.what());
        } catch (const PersistenceError& e) {
            send_error(res, 500, e.what());
        }
    });

    svr.Delete(R"(/api/sessions/([A-Za-z0-9_-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            engine_.remove(req.matches[1]);
            res.status = 204;
        } catch (const SessionNotFoundError& e) {
            send_error(res, 404, e.what());
        } catch (const PersistenceError& e) {
            send_error(res, 500, e.what());
        }
    });

    // Serve from filesystem
    if (fs::exists(www_dir_)) {
        svr.set_mount_point("/", www_dir_);
    } else {
        verbose_err("HTTP", "Static directory " + www_dir_ + " not found, serving API only");
    }

    if (!svr.bind_to_port(address, port)) {
        return false;
    }

    // Call the on_start callback before blocking
    if (on_start_callback_) {
        on_start_callback_(address, port);
    }

    // This blocks until server is stopped
    return svr.listen_after_bind();
}

void HttpServer::on_start(std::function<void(const std::string&, int)> callback) {
    on_start_callback_ = std::move(callback);
}

} // namespace talk
