#include "settings.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <initializer_list>

namespace talk {

namespace fs = std::filesystem;
using json = nlohmann::json;

static ModelSpec model_from_json(const json& j) {
    ModelSpec spec;
    spec.key = j.at("key").get<std::string>();
    spec.provider_id = j.value("provider_id", spec.key);
    spec.display_name = j.value("name", spec.key);
    spec.rate.input_per_mtok = j.at("input_per_mtok").get<double>();
    spec.rate.output_per_mtok = j.at("output_per_mtok").get<double>();
    if (spec.key.empty()) {
        throw ConfigError("Model entry has an empty key");
    }
    if (spec.rate.input_per_mtok < 0 || spec.rate.output_per_mtok < 0) {
        throw ConfigError("Model " + spec.key + " has a negative rate");
    }
    return spec;
}

std::optional<Settings> load_settings(const fs::path& path) {
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open " + path.string());
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            throw ConfigError(path.string() + " must contain a JSON object");
        }

        Settings settings;
        settings.default_model = j.value("default_model", "");
        settings.sessions_dir = j.value("sessions_dir", "");
        settings.max_tokens = j.value("max_tokens", 0);
        settings.api_base_url = j.value("api_base_url", "");
        settings.system_prompt = j.value("system_prompt", "");

        if (settings.max_tokens < 0) {
            throw ConfigError("max_tokens must not be negative");
        }

        if (j.contains("models")) {
            if (!j["models"].is_array()) {
                throw ConfigError("\"models\" must be an array");
            }
            for (const auto& model_json : j["models"]) {
                settings.models.push_back(model_from_json(model_json));
            }
        }

        verbose_log("CONFIG", "Loaded " + path.string());
        return settings;
    } catch (const json::exception& e) {
        throw ConfigError("Invalid " + path.string() + ": " + e.what());
    }
}

void save_settings(const Settings& settings, const fs::path& path) {
    json j = json::object();

    if (!settings.default_model.empty()) {
        j["default_model"] = settings.default_model;
    }
    if (!settings.sessions_dir.empty()) {
        j["sessions_dir"] = settings.sessions_dir;
    }
    if (settings.max_tokens > 0) {
        j["max_tokens"] = settings.max_tokens;
    }
    if (!settings.api_base_url.empty()) {
        j["api_base_url"] = settings.api_base_url;
    }
    if (!settings.system_prompt.empty()) {
        j["system_prompt"] = settings.system_prompt;
    }

    if (!settings.models.empty()) {
        json models = json::array();
        for (const auto& spec : settings.models) {
            models.push_back({
                {"key", spec.key},
                {"provider_id", spec.provider_id},
                {"name", spec.display_name},
                {"input_per_mtok", spec.rate.input_per_mtok},
                {"output_per_mtok", spec.rate.output_per_mtok}
            });
        }
        j["models"] = models;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot write " + path.string());
    }
    file << j.dump(2) << std::endl;
}

void apply_model_overrides(const Settings& settings, PricingTable& pricing) {
    for (const auto& spec : settings.models) {
        verbose_log("CONFIG", "Model entry " + spec.key + " -> " + spec.provider_id);
        pricing.upsert(spec);
    }
}

static std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

int load_dotenv(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return 0;
    }

    int count = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = strip_quotes(trim(line.substr(eq + 1)));

        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            verbose_log("CONFIG", "Set " + key + " from " + path.string());
            ++count;
        }
    }
    return count;
}

static std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

// First non-empty value in precedence order.
static std::string first_of(std::initializer_list<std::string> candidates) {
    for (const auto& candidate : candidates) {
        if (!candidate.empty()) {
            return candidate;
        }
    }
    return "";
}

ResolvedConfig resolve_config(const CliOverrides& cli, const Settings& settings) {
    ResolvedConfig config;
    config.model = first_of({cli.model, env_or_empty(ENV_MODEL), settings.default_model});
    config.sessions_dir = first_of({cli.sessions_dir, settings.sessions_dir, SESSIONS_DIR});
    config.api_base_url = first_of({cli.api_base_url, env_or_empty(ENV_BASE_URL), settings.api_base_url});
    config.system_prompt = settings.system_prompt;
    config.max_tokens = settings.max_tokens > 0 ? settings.max_tokens : DEFAULT_MAX_TOKENS;
    return config;
}

} // namespace talk
