#include "terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>
#include <cstdlib>

namespace talk {
namespace terminal {

int get_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }

    // Try COLUMNS environment variable
    const char* columns = std::getenv("COLUMNS");
    if (columns) {
        int width = std::atoi(columns);
        if (width > 0) {
            return width;
        }
    }

    // Default fallback
    return 80;
}

bool is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

// Byte length of the UTF-8 sequence starting with lead byte c.
static size_t utf8_length(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // Invalid lead byte, count as one column
}

int display_width(const std::string& text) {
    int width = 0;
    size_t i = 0;

    while (i < text.length()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        // ANSI escape sequences have zero width
        if (c == '\033') {
            ++i;
            if (i < text.length() && text[i] == '[') {
                ++i;
                while (i < text.length() && !(text[i] >= '@' && text[i] <= '~')) {
                    ++i;
                }
                if (i < text.length()) {
                    ++i;
                }
            }
            continue;
        }

        i += utf8_length(c);
        ++width;
    }

    return width;
}

std::string fit_width(const std::string& text, int max_width) {
    if (max_width <= 0) {
        return "";
    }
    if (display_width(text) <= max_width) {
        return text;
    }

    int budget = max_width > 3 ? max_width - 3 : max_width;
    std::string result;
    int width = 0;
    size_t i = 0;
    while (i < text.length() && width < budget) {
        size_t len = utf8_length(static_cast<unsigned char>(text[i]));
        result.append(text, i, len);
        i += len;
        ++width;
    }
    if (max_width > 3) {
        result += "...";
    }
    return result;
}

namespace clear {
    std::string to_end_of_line() {
        return "\033[K";
    }

    std::string screen() {
        return "\033[2J\033[H";
    }
}

} // namespace terminal
} // namespace talk
