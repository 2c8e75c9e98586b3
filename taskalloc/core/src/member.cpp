#include <taskalloc/core/member.hpp>
#include <taskalloc/core/error.hpp>

#include <cmath>
#include <utility>

namespace taskalloc::core {

Member::Member(std::string id, std::string name, Competencies competencies,
               double max_capacity, double current_workload)
    : id_(std::move(id))
    , name_(std::move(name))
    , competencies_(std::move(competencies))
    , max_capacity_(max_capacity)
    , current_workload_(current_workload) {
    if (!std::isfinite(max_capacity_) || max_capacity_ <= 0.0) {
        throw InvalidEntityError("member '" + id_ + "': maxCapacity must be positive");
    }
    if (!std::isfinite(current_workload_) || current_workload_ < 0.0) {
        throw InvalidEntityError("member '" + id_ + "': currentWorkload must be non-negative");
    }
    for (const auto& [competency, level] : competencies_) {
        if (!std::isfinite(level) || level < 0.0) {
            throw InvalidEntityError("member '" + id_ + "': level of '" + competency +
                                     "' must be non-negative");
        }
    }
}

bool Member::has_competency(const std::string& competency) const {
    return competencies_.find(competency) != competencies_.end();
}

std::optional<double> Member::proficiency(const std::string& competency) const {
    auto it = competencies_.find(competency);
    if (it == competencies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Member::commit(double hours) {
    if (!can_take(hours)) {
        throw InvalidEntityError("member '" + id_ + "': committing " + std::to_string(hours) +
                                 "h exceeds remaining capacity " +
                                 std::to_string(remaining_capacity()) + "h");
    }
    current_workload_ += hours;
}

} // namespace taskalloc::core
