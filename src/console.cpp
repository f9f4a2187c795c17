#include "console.hpp"
#include "config.hpp"
#include "cost.hpp"
#include "terminal.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>

namespace talk {

Console::Console() : colors_enabled_(true) {
    enable_colors();
}

void Console::enable_colors() {
    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb" || !terminal::is_tty()) {
        colors_enabled_ = false;
    }
}

void Console::print(const std::string& text) const {
    std::cout << text;
}

void Console::println(const std::string& text) const {
    std::cout << text << std::endl;
}

void Console::print_colored(const std::string& text, const char* color) const {
    if (colors_enabled_) {
        std::cout << color << text << ansi::RESET;
    } else {
        std::cout << text;
    }
}

void Console::print_error(const std::string& text) const {
    print_colored(text, ansi::RED);
    std::cout << std::endl;
}

void Console::print_warning(const std::string& text) const {
    print_colored(text, ansi::YELLOW);
    std::cout << std::endl;
}

void Console::print_success(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::GREEN << "✓" << ansi::RESET << " " << text << std::endl;
    } else {
        std::cout << "* " << text << std::endl;
    }
}

void Console::print_info(const std::string& text) const {
    print_colored(text, ansi::CYAN);
    std::cout << std::endl;
}

void Console::print_header(const std::string& text) const {
    if (colors_enabled_) {
        std::cout << ansi::BOLD << ansi::CYAN << text << ansi::RESET << std::endl;
    } else {
        std::cout << text << std::endl;
    }
}

void Console::print_role_label(Role role) const {
    if (role == Role::User) {
        print_colored("You: ", ansi::GREEN);
    } else {
        print_colored("Claude: ", ansi::BLUE);
    }
}

void Console::print_turn_stats(const TokenUsage& usage, double turn_cost, double total_cost) const {
    std::string line = "Tokens: " + std::to_string(usage.input_tokens) + " in / " +
                       std::to_string(usage.output_tokens) + " out | Cost: " +
                       format_cost(turn_cost) + " | Total: " + format_cost(total_cost);
    print_colored(line, ansi::DIM);
    std::cout << std::endl;
}

void Console::print_session_list(const std::vector<SessionSummary>& sessions) const {
    int width = terminal::get_width();
    for (size_t i = 0; i < sessions.size(); ++i) {
        const auto& s = sessions[i];
        std::string head = std::to_string(i + 1) + ". [" + format_local_minutes(s.created_at) + "] ";
        std::string tail = " (" + format_cost(s.total_cost) + ")";
        int room = width - terminal::display_width(head) - terminal::display_width(tail);
        std::string preview = terminal::fit_width(s.preview, room < 10 ? 10 : room);

        std::cout << head;
        std::cout << preview;
        print_colored(tail, ansi::DIM);
        std::cout << std::endl;
    }
}

void Console::clear_screen() const {
    if (colors_enabled_) {
        std::cout << terminal::clear::screen() << std::flush;
    }
}

std::string Console::prompt(const std::string& message, const std::string& default_value) const {
    if (!default_value.empty()) {
        std::cout << message << " [" << default_value << "]: ";
    } else {
        std::cout << message << ": ";
    }
    std::cout << std::flush;

    std::string input;
    if (!std::getline(std::cin, input)) {
        return default_value;
    }

    input = trim(input);
    if (input.empty() && !default_value.empty()) {
        return default_value;
    }
    return input;
}

void Console::print_raw(const std::string& text) const {
    std::cout << text;
}

void Console::flush() const {
    std::cout << std::flush;
}

// ========== Spinner ==========

Spinner::Spinner(const Console& console, bool enabled) : console_(console) {
    if (!enabled) {
        stop_.store(true);
        return;
    }
    thread_ = std::thread([this]() {
        const char* frames[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
        int frame = 0;
        while (!stop_.load()) {
            std::string spinner_line = "\r";
            if (console_.colors_enabled()) {
                spinner_line += ansi::CYAN;
            }
            spinner_line += frames[frame];
            spinner_line += " Thinking...";
            if (console_.colors_enabled()) {
                spinner_line += ansi::RESET;
            }
            console_.print_raw(spinner_line);
            console_.flush();
            frame = (frame + 1) % 10;
            std::this_thread::sleep_for(std::chrono::milliseconds(80));
        }
    });
}

Spinner::~Spinner() {
    stop();
}

void Spinner::stop() {
    stop_.store(true);
    if (thread_.joinable()) {
        thread_.join();
        console_.print_raw("\r" + terminal::clear::to_end_of_line());
        console_.flush();
    }
}

} // namespace talk
