#include "types.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace talk {

std::string role_to_string(Role role) {
    switch (role) {
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
    }
    return "user";
}

Role role_from_string(const std::string& value) {
    if (value == "user") {
        return Role::User;
    }
    if (value == "assistant") {
        return Role::Assistant;
    }
    throw std::invalid_argument("Unknown message role: " + value);
}

TimePoint now_millis() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

std::string format_timestamp(TimePoint tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto ms = (since_epoch - secs).count();

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::string format_local_minutes(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm_local{};
    localtime_r(&t, &tm_local);

    std::ostringstream oss;
    oss << std::put_time(&tm_local, "%Y-%m-%d %H:%M");
    return oss.str();
}

TimePoint parse_timestamp(const std::string& text) {
    std::tm tm_utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        // Normalize to exactly three digits
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }

    std::time_t secs = timegm(&tm_utc);
    return TimePoint(std::chrono::seconds(secs) + std::chrono::milliseconds(millis));
}

std::string make_preview(const std::string& text, size_t max_length) {
    std::string first_line = text.substr(0, text.find('\n'));

    // Count code points, not bytes, so a cut never splits a UTF-8 sequence
    size_t count = 0;
    for (size_t i = 0; i < first_line.length(); ++i) {
        if ((static_cast<unsigned char>(first_line[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (count == max_length) {
            return first_line.substr(0, i) + "...";
        }
        ++count;
    }
    return first_line;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

} // namespace talk
