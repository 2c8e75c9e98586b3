#pragma once

/// @file team_generation.hpp
/// @brief Random team generation for benchmarks and experiments.
///
/// Produces complete core::Team instances with members drawn from a
/// competency pool and tasks with random requirements, effort, priority,
/// and deadline.
///
/// @ingroup io_generation

#include <taskalloc/core/team.hpp>
#include <taskalloc/core/types.hpp>

#include <cstddef>
#include <random>
#include <string>
#include <vector>

namespace taskalloc::io {

/// @brief Parameters of a randomly generated team.
///
/// @ingroup io_generation
/// @see generate_team
struct GenerationParams {
    std::size_t member_count{10};           ///< Members to generate.
    std::size_t task_count{50};             ///< Tasks to generate.
    std::vector<std::string> competencies{  ///< Pool of competency names.
        "React", "JavaScript", "CSS", "Node.js", "Python",
        "SQL", "Docker", "AWS", "Testing", "Design"};
    std::size_t skills_per_member_min{2};   ///< Minimum competencies per member.
    std::size_t skills_per_member_max{5};   ///< Maximum competencies per member.
    std::size_t skills_per_task_min{1};     ///< Minimum required competencies per task.
    std::size_t skills_per_task_max{3};     ///< Maximum required competencies per task.
    double level_min{1.0};                  ///< Lowest proficiency level.
    double level_max{10.0};                 ///< Highest proficiency level.
    double capacity_min{20.0};              ///< Lowest member capacity (hours).
    double capacity_max{40.0};              ///< Highest member capacity (hours).
    double hours_min{1.0};                  ///< Lowest task estimate (hours).
    double hours_max{16.0};                 ///< Highest task estimate (hours).
    core::CalendarDate first_deadline{core::make_date(2025, 1, 1)};  ///< Earliest deadline.
    int deadline_window_days{90};           ///< Deadlines fall within this many days.
};

/// @brief Generate a random team.
///
/// Levels, capacities and hours are rounded to whole numbers; members get
/// ids `m1..mN`, tasks `t1..tN`. Priorities are uniform over the three
/// classes.
///
/// @param params Generation parameters.
/// @param rng    Mersenne Twister PRNG instance.
/// @return The generated team.
///
/// @throws std::invalid_argument if a range is empty or inverted, or the
///         competency pool is smaller than the per-entity maximum.
core::Team generate_team(const GenerationParams& params, std::mt19937& rng);

} // namespace taskalloc::io
