#include <taskalloc/core/task.hpp>
#include <taskalloc/core/error.hpp>

#include <cmath>
#include <utility>

namespace taskalloc::core {

Task::Task(std::string id, std::string title, std::string description,
           std::vector<std::string> required_competencies, double estimated_hours,
           Priority priority, CalendarDate deadline)
    : id_(std::move(id))
    , title_(std::move(title))
    , description_(std::move(description))
    , required_competencies_(std::move(required_competencies))
    , estimated_hours_(estimated_hours)
    , priority_(priority)
    , deadline_(deadline) {
    if (!std::isfinite(estimated_hours_) || estimated_hours_ <= 0.0) {
        throw InvalidEntityError("task '" + id_ + "': estimatedHours must be positive");
    }
    if (!deadline_.ok()) {
        throw InvalidEntityError("task '" + id_ + "': deadline is not a valid calendar day");
    }
}

} // namespace taskalloc::core
