#include <taskalloc/io/team_generation.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace taskalloc::io {

namespace {

void validate(const GenerationParams& params) {
    if (params.competencies.empty()) {
        throw std::invalid_argument("competency pool must not be empty");
    }
    if (params.skills_per_member_min == 0 ||
        params.skills_per_member_min > params.skills_per_member_max ||
        params.skills_per_member_max > params.competencies.size()) {
        throw std::invalid_argument("invalid skills per member range");
    }
    if (params.skills_per_task_min == 0 ||
        params.skills_per_task_min > params.skills_per_task_max ||
        params.skills_per_task_max > params.competencies.size()) {
        throw std::invalid_argument("invalid skills per task range");
    }
    if (params.level_min < 0.0 || params.level_min > params.level_max) {
        throw std::invalid_argument("invalid level range");
    }
    if (params.capacity_min < 1.0 || params.capacity_min > params.capacity_max) {
        throw std::invalid_argument("invalid capacity range");
    }
    if (params.hours_min < 1.0 || params.hours_min > params.hours_max) {
        throw std::invalid_argument("invalid hours range");
    }
    if (params.deadline_window_days < 1) {
        throw std::invalid_argument("deadline window must be at least one day");
    }
}

// Pick `count` distinct names from the pool, in pool order.
std::vector<std::string> sample_competencies(const std::vector<std::string>& pool,
                                             std::size_t count, std::mt19937& rng) {
    std::vector<std::string> picked;
    picked.reserve(count);
    std::sample(pool.begin(), pool.end(), std::back_inserter(picked), count, rng);
    return picked;
}

std::size_t uniform_count(std::size_t lo, std::size_t hi, std::mt19937& rng) {
    std::uniform_int_distribution<std::size_t> dist(lo, hi);
    return dist(rng);
}

double uniform_whole(double lo, double hi, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return std::round(dist(rng));
}

} // anonymous namespace

core::Team generate_team(const GenerationParams& params, std::mt19937& rng) {
    validate(params);

    core::Team team;

    for (std::size_t i = 0; i < params.member_count; ++i) {
        auto count = uniform_count(params.skills_per_member_min, params.skills_per_member_max, rng);
        core::Member::Competencies competencies;
        for (auto& name : sample_competencies(params.competencies, count, rng)) {
            competencies[name] = uniform_whole(params.level_min, params.level_max, rng);
        }
        double capacity = uniform_whole(params.capacity_min, params.capacity_max, rng);
        std::string id = "m" + std::to_string(i + 1);
        team.add_member(core::Member(id, "Member " + std::to_string(i + 1),
                                     std::move(competencies), capacity));
    }

    std::uniform_int_distribution<int> priority_dist(0, 2);
    std::uniform_int_distribution<int> day_dist(0, params.deadline_window_days - 1);
    const std::chrono::sys_days first{params.first_deadline};

    for (std::size_t i = 0; i < params.task_count; ++i) {
        auto count = uniform_count(params.skills_per_task_min, params.skills_per_task_max, rng);
        auto required = sample_competencies(params.competencies, count, rng);
        std::shuffle(required.begin(), required.end(), rng);

        double hours = uniform_whole(params.hours_min, params.hours_max, rng);
        auto priority = static_cast<core::Priority>(priority_dist(rng));
        core::CalendarDate deadline{first + std::chrono::days{day_dist(rng)}};

        std::string id = "t" + std::to_string(i + 1);
        team.add_task(core::Task(id, "Task " + std::to_string(i + 1), "",
                                 std::move(required), hours, priority, deadline));
    }

    return team;
}

} // namespace taskalloc::io
