#include "transcript_store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace talk {

json session_to_json(const Session& session) {
    json messages = json::array();
    for (const auto& msg : session.messages) {
        messages.push_back(msg.to_json());
    }

    return {
        {"id", session.id},
        {"created_at", format_timestamp(session.created_at)},
        {"model", session.model},
        {"messages", messages},
        {"total_cost", session.total_cost}
    };
}

Session session_from_json(const json& j) {
    try {
        Session session;
        session.id = j.at("id").get<std::string>();
        session.created_at = parse_timestamp(j.at("created_at").get<std::string>());
        session.model = j.at("model").get<std::string>();
        session.total_cost = j.value("total_cost", 0.0);

        const json& messages = j.at("messages");
        if (!messages.is_array()) {
            throw PersistenceError("Record " + session.id + ": messages is not an array");
        }
        for (const auto& msg : messages) {
            session.messages.push_back({
                role_from_string(msg.at("role").get<std::string>()),
                msg.at("content").get<std::string>()
            });
        }
        return session;
    } catch (const json::exception& e) {
        throw PersistenceError(std::string("Malformed transcript record: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw PersistenceError(std::string("Malformed transcript record: ") + e.what());
    }
}

TranscriptStore::TranscriptStore(fs::path dir) : dir_(std::move(dir)) {}

bool TranscriptStore::is_valid_id(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char ch) {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
               (ch >= '0' && ch <= '9') || ch == '-' || ch == '_';
    });
}

void TranscriptStore::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw PersistenceError("Cannot create transcript directory " + dir_.string() + ": " + ec.message());
    }
}

fs::path TranscriptStore::path_for(const std::string& id) const {
    return dir_ / (id + ".json");
}

bool TranscriptStore::exists(const std::string& id) const {
    std::error_code ec;
    return is_valid_id(id) && fs::is_regular_file(path_for(id), ec);
}

Session TranscriptStore::load(const std::string& id) const {
    ensure_directory();

    if (!exists(id)) {
        throw SessionNotFoundError(id);
    }

    fs::path path = path_for(id);
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PersistenceError("Cannot open " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw PersistenceError("Cannot parse " + path.string() + ": " + e.what());
    }

    Session session = session_from_json(j);
    verbose_log("STORE", "Loaded " + id + " (" + std::to_string(session.messages.size()) + " messages)");
    return session;
}

void TranscriptStore::save(const Session& session) const {
    if (!is_valid_id(session.id)) {
        throw PersistenceError("Invalid session id: " + session.id);
    }
    ensure_directory();

    fs::path final_path = path_for(session.id);
    fs::path tmp_path = final_path;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw PersistenceError("Cannot write " + tmp_path.string());
        }
        file << session_to_json(session).dump(2) << std::endl;
        file.flush();
        if (!file.good()) {
            file.close();
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            throw PersistenceError("Write failed for " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw PersistenceError("Cannot replace " + final_path.string() + ": " + ec.message());
    }

    verbose_log("STORE", "Saved " + session.id + " -> " + final_path.string());
}

std::vector<SessionSummary> TranscriptStore::list() const {
    ensure_directory();

    std::vector<SessionSummary> summaries;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }

        std::string id = entry.path().stem().string();
        try {
            Session session = load(id);

            SessionSummary summary;
            summary.id = session.id;
            summary.created_at = session.created_at;
            summary.model = session.model;
            summary.total_cost = session.total_cost;
            summary.message_count = session.messages.size();
            summary.preview = "New conversation";
            for (const auto& msg : session.messages) {
                if (msg.role == Role::User) {
                    summary.preview = make_preview(msg.content, PREVIEW_LENGTH);
                    break;
                }
            }
            summaries.push_back(std::move(summary));
        } catch (const std::runtime_error& e) {
            // One bad record must not hide the others
            verbose_err("STORE", "Skipping " + entry.path().string() + ": " + e.what());
        }
    }

    std::sort(summaries.begin(), summaries.end(),
        [](const SessionSummary& a, const SessionSummary& b) {
            if (a.created_at != b.created_at) {
                return a.created_at > b.created_at;
            }
            return a.id < b.id;
        });
    return summaries;
}

void TranscriptStore::remove(const std::string& id) const {
    if (!exists(id)) {
        throw SessionNotFoundError(id);
    }

    std::error_code ec;
    fs::remove(path_for(id), ec);
    if (ec) {
        throw PersistenceError("Cannot delete " + path_for(id).string() + ": " + ec.message());
    }
    verbose_log("STORE", "Removed " + id);
}

} // namespace talk
