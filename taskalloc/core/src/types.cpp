#include <taskalloc/core/types.hpp>
#include <taskalloc/core/error.hpp>

#include <cctype>
#include <cstdio>

namespace taskalloc::core {

namespace {

// Parse a fixed-width run of decimal digits; -1 if any character is not a digit.
int parse_digits(std::string_view text) {
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // anonymous namespace

std::string_view to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::High:   return "high";
        case Priority::Medium: return "medium";
        case Priority::Low:    return "low";
    }
    return "unknown";
}

Priority parse_priority(std::string_view name) {
    if (name == "high") {
        return Priority::High;
    }
    if (name == "medium") {
        return Priority::Medium;
    }
    if (name == "low") {
        return Priority::Low;
    }
    throw InvalidEntityError("unknown priority '" + std::string(name) +
                             "' (expected high, medium or low)");
}

CalendarDate parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw InvalidEntityError("date '" + std::string(text) + "' must be formatted YYYY-MM-DD");
    }

    int year = parse_digits(text.substr(0, 4));
    int month = parse_digits(text.substr(5, 2));
    int day = parse_digits(text.substr(8, 2));
    if (year < 0 || month < 0 || day < 0) {
        throw InvalidEntityError("date '" + std::string(text) + "' must be formatted YYYY-MM-DD");
    }

    auto date = make_date(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    if (!date.ok()) {
        throw InvalidEntityError("date '" + std::string(text) + "' is not a valid calendar day");
    }
    return date;
}

std::string format_date(CalendarDate date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buffer;
}

} // namespace taskalloc::core
