#pragma once

#include <taskalloc/core/types.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace taskalloc::core {

/// @brief A discrete work item requiring a set of competencies.
/// @ingroup core_model
///
/// The required competencies are kept in input order, although the order
/// has no effect on scoring. The assignment outcome is the only mutable
/// state: either unassigned or the id of the member the task went to.
///
/// @see Member, Team
class Task {
public:
    /// @brief Construct a new Task.
    /// @param id                    Unique task identifier.
    /// @param title                 Short title.
    /// @param description           Free-form description (opaque).
    /// @param required_competencies Competency names the task needs.
    /// @param estimated_hours       Effort estimate in hours (must be > 0).
    /// @param priority              Urgency class.
    /// @param deadline              Due date.
    /// @throws InvalidEntityError if @p estimated_hours is not a positive
    ///         finite number or @p deadline is not a valid calendar day.
    Task(std::string id, std::string title, std::string description,
         std::vector<std::string> required_competencies, double estimated_hours,
         Priority priority, CalendarDate deadline);

    /// @brief Get the unique task identifier.
    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    /// @brief Get the title.
    [[nodiscard]] const std::string& title() const noexcept { return title_; }

    /// @brief Get the description.
    [[nodiscard]] const std::string& description() const noexcept { return description_; }

    /// @brief Get the required competency names, in input order.
    [[nodiscard]] const std::vector<std::string>& required_competencies() const noexcept {
        return required_competencies_;
    }

    /// @brief Get the effort estimate in hours.
    [[nodiscard]] double estimated_hours() const noexcept { return estimated_hours_; }

    /// @brief Get the priority class.
    [[nodiscard]] Priority priority() const noexcept { return priority_; }

    /// @brief Get the deadline.
    [[nodiscard]] CalendarDate deadline() const noexcept { return deadline_; }

    /// @brief Check whether the task is currently assigned.
    [[nodiscard]] bool is_assigned() const noexcept { return assigned_to_.has_value(); }

    /// @brief Id of the member the task is assigned to, if any.
    [[nodiscard]] const std::optional<std::string>& assigned_member() const noexcept {
        return assigned_to_;
    }

    /// @brief Record the task as assigned to @p member_id.
    void assign_to(std::string member_id) { assigned_to_ = std::move(member_id); }

    /// @brief Mark the task as unassigned.
    void clear_assignment() noexcept { assigned_to_.reset(); }

private:
    std::string id_;
    std::string title_;
    std::string description_;
    std::vector<std::string> required_competencies_;
    double estimated_hours_;
    Priority priority_;
    CalendarDate deadline_;
    std::optional<std::string> assigned_to_;
};

} // namespace taskalloc::core
