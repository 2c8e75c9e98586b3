#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace taskalloc::core {

/// @brief Urgency class of a task.
///
/// Tasks are processed from High to Low; see priority_weight().
///
/// @ingroup core_types
enum class Priority {
    High,    ///< Processed first (weight 3).
    Medium,  ///< Weight 2.
    Low      ///< Processed last (weight 1).
};

/// @brief Numeric weight used to order tasks by priority.
/// @param priority The priority class.
/// @return 3 for High, 2 for Medium, 1 for Low.
/// @ingroup core_types
[[nodiscard]] constexpr int priority_weight(Priority priority) noexcept {
    switch (priority) {
        case Priority::High:   return 3;
        case Priority::Medium: return 2;
        case Priority::Low:    return 1;
    }
    return 0;
}

/// @brief Lowercase name of a priority (`"high"`, `"medium"`, `"low"`).
/// @ingroup core_types
[[nodiscard]] std::string_view to_string(Priority priority) noexcept;

/// @brief Parse a lowercase priority name.
/// @param name One of `"high"`, `"medium"`, `"low"`.
/// @return The matching Priority.
/// @throws InvalidEntityError for any other string.
/// @ingroup core_types
Priority parse_priority(std::string_view name);

/// @brief A task deadline: a calendar day with no time-of-day component.
/// @ingroup core_types
using CalendarDate = std::chrono::year_month_day;

/// @brief Parse an ISO-8601 calendar date of the form `YYYY-MM-DD`.
///
/// @param text  The date text.
/// @return The parsed date.
/// @throws InvalidEntityError if @p text is not exactly `YYYY-MM-DD` or
///         names a day that does not exist (e.g. `2025-02-30`).
/// @ingroup core_types
CalendarDate parse_date(std::string_view text);

/// @brief Format a date as `YYYY-MM-DD`.
/// @ingroup core_types
[[nodiscard]] std::string format_date(CalendarDate date);

/// @brief Convenience constructor for a calendar date.
/// @ingroup core_types
[[nodiscard]] constexpr CalendarDate make_date(int year, unsigned month, unsigned day) noexcept {
    return CalendarDate{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
}

} // namespace taskalloc::core
