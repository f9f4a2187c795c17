#pragma once

/**
 * Settings persistence for the ctalk CLI.
 *
 * Handles loading and saving of application settings to a local JSON file,
 * the optional .env file, and resolving the effective configuration from
 * command line, environment, settings file and built-in defaults.
 */

#include "config.hpp"
#include "pricing.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace talk {

/**
 * Application settings stored in .ctalk.json.
 *
 * Every field is optional in the file; absent fields keep their defaults.
 */
struct Settings {
    std::string default_model;           // Pricing key used when no model is given.
    std::string sessions_dir;            // Transcript directory.
    int max_tokens = 0;                  // Reply length cap (0 = built-in default).
    std::string api_base_url;            // Messages API host override.
    std::string system_prompt;           // Sent as the "system" field when non-empty.
    std::vector<ModelSpec> models;       // Extra or replacement pricing entries.
};

// Loads settings from path. Returns empty optional if the file doesn't exist.
// Throws ConfigError if the file is unreadable or malformed.
std::optional<Settings> load_settings(const std::filesystem::path& path = SETTINGS_FILE);

// Saves settings to path. Throws ConfigError on write failure.
void save_settings(const Settings& settings, const std::filesystem::path& path = SETTINGS_FILE);

// Adds the settings' model entries to the table (same key replaces).
void apply_model_overrides(const Settings& settings, PricingTable& pricing);

/**
 * Reads KEY=value lines into the process environment.
 *
 * Blank lines and lines starting with '#' are skipped, an optional "export "
 * prefix is accepted and matching surrounding quotes are removed. Variables
 * already set in the environment are left untouched. Returns the number of
 * variables set; a missing file sets none.
 */
int load_dotenv(const std::filesystem::path& path);

/**
 * Values given on the command line. Empty means "not given".
 */
struct CliOverrides {
    std::string model;
    std::string sessions_dir;
    std::string api_base_url;
};

/**
 * Effective configuration after applying precedence
 * command line > environment > settings file > built-in default.
 */
struct ResolvedConfig {
    std::string model;          // Empty when nothing selected a model.
    std::string sessions_dir;
    std::string api_base_url;   // Empty means the transport default.
    std::string system_prompt;
    int max_tokens = 0;
};

// Resolves configuration. Reads ANTHROPIC_MODEL and ANTHROPIC_BASE_URL.
ResolvedConfig resolve_config(const CliOverrides& cli, const Settings& settings);

} // namespace talk
