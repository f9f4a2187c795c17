#pragma once

/**
 * File-backed persistence for conversation transcripts.
 *
 * Each session is one JSON record, <dir>/<id>.json. Saves write a sibling
 * temp file and rename it into place, so a reader (or a crash) only ever
 * sees the previous complete record or the new complete record.
 */

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace talk {

// Serializes a session to its record format.
nlohmann::json session_to_json(const Session& session);

// Parses a record. Throws PersistenceError if required fields are missing or invalid.
Session session_from_json(const nlohmann::json& j);

/**
 * Key-value store of sessions keyed by id.
 */
class TranscriptStore {
public:
    // Uses the given directory; it is created on first use if absent.
    explicit TranscriptStore(std::filesystem::path dir);

    // Loads a session. Throws SessionNotFoundError or PersistenceError.
    Session load(const std::string& id) const;

    // Atomically replaces the stored record. Throws PersistenceError.
    void save(const Session& session) const;

    // Summaries of all readable records, most recent first.
    std::vector<SessionSummary> list() const;

    // Deletes a record. Throws SessionNotFoundError or PersistenceError.
    void remove(const std::string& id) const;

    // Returns true if a record exists for the id.
    bool exists(const std::string& id) const;

    // Directory holding the records.
    const std::filesystem::path& directory() const { return dir_; }

    // True if id only uses [A-Za-z0-9_-] and is non-empty.
    static bool is_valid_id(const std::string& id);

private:
    std::filesystem::path dir_;

    // Creates the directory if needed. Throws PersistenceError.
    void ensure_directory() const;

    std::filesystem::path path_for(const std::string& id) const;
};

} // namespace talk
