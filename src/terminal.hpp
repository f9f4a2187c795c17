#pragma once

#include <string>

namespace talk {
namespace terminal {

/**
 * Get the terminal width in columns.
 * Returns 80 if width cannot be determined.
 */
int get_width();

/**
 * Check if stdout is a TTY (interactive terminal).
 */
bool is_tty();

/**
 * Calculate the display width of a string, accounting for
 * ANSI escape sequences (which have zero width) and
 * multi-byte UTF-8 characters.
 */
int display_width(const std::string& text);

/**
 * Cut text to at most max_width display columns, appending "..." when cut.
 * ANSI escape sequences are not expected in the input.
 */
std::string fit_width(const std::string& text, int max_width);

namespace clear {
    /**
     * Clear from cursor to end of line.
     * ANSI: \033[K
     */
    std::string to_end_of_line();

    /**
     * Clear the screen and move the cursor home.
     * ANSI: \033[2J\033[H
     */
    std::string screen();
}

} // namespace terminal
} // namespace talk
