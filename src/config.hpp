#pragma once

/**
 * Application configuration constants.
 *
 * Defines file paths, provider API settings and display limits for the
 * ctalk CLI.
 */

#include <cstddef>

namespace talk {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".ctalk.json";     // Local settings file.
constexpr const char* SESSIONS_DIR = "conversations";    // Directory for transcripts.
constexpr const char* DOTENV_FILE = ".env";              // Optional KEY=value file.
constexpr const char* WWW_DIR = "www";                   // Static files for server mode.

// ========== Environment ==========

constexpr const char* ENV_API_KEY = "ANTHROPIC_API_KEY";
constexpr const char* ENV_MODEL = "ANTHROPIC_MODEL";
constexpr const char* ENV_BASE_URL = "ANTHROPIC_BASE_URL";

// ========== API Configuration ==========

constexpr const char* ANTHROPIC_API_BASE = "https://api.anthropic.com";  // Messages API host.
constexpr const char* ANTHROPIC_VERSION = "2023-06-01";                  // anthropic-version header.
constexpr int DEFAULT_MAX_TOKENS = 8000;                                 // Reply length cap.

// ========== Display ==========

constexpr size_t PREVIEW_LENGTH = 60;      // Characters of the first user message in listings.
constexpr size_t LIST_LIMIT = 20;          // Conversations shown in the terminal menus.
constexpr const char* MULTILINE_END = "###";

} // namespace talk
