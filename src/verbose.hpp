#pragma once

/**
 * Verbose logging utility for ctalk.
 *
 * Provides debug output for provider requests, the SSE stream, transcript
 * storage and the web surfaces when the -v/--verbose flag is enabled.
 * Lines go to stderr so they never mix with streamed replies on stdout.
 */

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace talk {

/**
 * Global verbose mode flag. Read from worker threads in server mode.
 */
inline std::atomic<bool> g_verbose{false};

/**
 * Serializes log lines written from several threads.
 */
inline std::mutex g_log_mutex;

/**
 * Set verbose mode.
 */
inline void set_verbose(bool enabled) {
    g_verbose.store(enabled);
}

/**
 * Check if verbose mode is enabled.
 */
inline bool is_verbose() {
    return g_verbose.load();
}

/**
 * Get current timestamp as string.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

inline void write_log_line(const char* color, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "\033[90m[" << timestamp() << "] " << color << "[" << tag << "]\033[0m "
              << message << std::endl;
}

/**
 * Log a verbose message with timestamp and category.
 */
inline void verbose_log(const std::string& category, const std::string& message) {
    if (!is_verbose()) return;
    write_log_line("\033[36m", category, message);
}

/**
 * Log outgoing data (requests).
 */
inline void verbose_out(const std::string& category, const std::string& message) {
    if (!is_verbose()) return;
    write_log_line("\033[33m", category + " >>>", message);
}

/**
 * Log incoming data (responses).
 */
inline void verbose_in(const std::string& category, const std::string& message) {
    if (!is_verbose()) return;
    write_log_line("\033[32m", category + " <<<", message);
}

/**
 * Log error messages (only shown in verbose mode; callers still report
 * the error through their normal channel).
 */
inline void verbose_err(const std::string& category, const std::string& message) {
    if (!is_verbose()) return;
    write_log_line("\033[31m", category + " ERR", message);
}

/**
 * Truncate long content for display.
 */
inline std::string truncate(const std::string& s, size_t max_len = 200) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

/**
 * Format a JSON body for compact display (single line, truncated).
 */
inline std::string format_json_compact(const std::string& json_str, size_t max_len = 500) {
    std::string compact;
    compact.reserve(json_str.size());
    bool in_string = false;
    bool last_was_space = false;

    for (char c : json_str) {
        if (c == '"' && (compact.empty() || compact.back() != '\\')) {
            in_string = !in_string;
        }

        if (in_string) {
            compact += c;
            last_was_space = false;
        } else if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!last_was_space) {
                compact += ' ';
                last_was_space = true;
            }
        } else {
            compact += c;
            last_was_space = false;
        }
    }

    return truncate(compact, max_len);
}

} // namespace talk
