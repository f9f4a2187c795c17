#pragma once

#include "types.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace talk {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Terminal output helper with color support.
 *
 * Provides styled output for the chat surface. Falls back to plain text when
 * colors are not supported (TERM=dumb, TERM unset or stdout not a TTY).
 */
class Console {
public:
    // Creates a Console instance and detects color support.
    Console();

    bool colors_enabled() const { return colors_enabled_; }

    // ========== Basic Output ==========

    // Prints text without a trailing newline.
    void print(const std::string& text) const;

    // Prints text followed by a newline.
    void println(const std::string& text = "") const;

    // Prints text with a specific ANSI color code, no newline.
    void print_colored(const std::string& text, const char* color) const;

    // ========== Message Levels ==========

    void print_error(const std::string& text) const;
    void print_warning(const std::string& text) const;
    void print_success(const std::string& text) const;
    void print_info(const std::string& text) const;
    void print_header(const std::string& text) const;

    // ========== Chat Output ==========

    // Prints the "You:" / "Claude:" label that starts a message.
    void print_role_label(Role role) const;

    // Prints "Tokens: <in> in / <out> out | Cost: $x | Total: $y".
    void print_turn_stats(const TokenUsage& usage, double turn_cost, double total_cost) const;

    // Prints a numbered listing of stored conversations with date, preview and cost.
    void print_session_list(const std::vector<SessionSummary>& sessions) const;

    // Clears the screen.
    void clear_screen() const;

    // ========== Interactive Prompts ==========

    // Prompts the user for input with an optional default value.
    // Returns the default (or "") when stdin is closed.
    std::string prompt(const std::string& message, const std::string& default_value = "") const;

    // ========== Raw Output ==========

    // Prints text without newline or formatting (for streaming output).
    void print_raw(const std::string& text) const;

    // Flushes stdout.
    void flush() const;

private:
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();
};

/**
 * Animated "Thinking..." indicator on its own thread.
 *
 * Runs from construction until stop() (or destruction). stop() clears the
 * spinner line and may be called more than once.
 */
class Spinner {
public:
    Spinner(const Console& console, bool enabled);
    ~Spinner();

    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;

    void stop();

private:
    const Console& console_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

} // namespace talk
