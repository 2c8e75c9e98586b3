#pragma once

/// @file assignment.hpp
/// @brief Per-task outcome records and the result of an allocation run.
/// @ingroup algo_allocators

#include <taskalloc/core/team.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskalloc::algo {

/// @brief Member name reported for a task nobody could take.
inline constexpr std::string_view UNASSIGNED_NAME = "Unassigned";

/// @brief Reason reported for a task nobody could take.
inline constexpr std::string_view NO_MEMBER_REASON = "No available member with required skills";

/// @brief Outcome of allocating one task.
///
/// @see AllocationResult
struct AssignmentRecord {
    std::string task_id;                  ///< Id of the task.
    std::string task_title;               ///< Title of the task.
    std::optional<std::string> member_id; ///< Assigned member, or empty.
    std::string member_name;              ///< Assigned member's name, or UNASSIGNED_NAME.
    double match_score{0.0};              ///< Winning score (0 when unassigned).
    double estimated_hours{0.0};          ///< The task's effort estimate.
    std::optional<std::string> reason;    ///< Set only when unassigned.

    /// @brief Check whether a member was found.
    [[nodiscard]] bool is_assigned() const noexcept { return member_id.has_value(); }
};

/// @brief New team state plus the ordered assignment records of one run.
///
/// @c state is the snapshot given to the allocator after the run: member
/// workloads reflect the committed hours and task outcomes are set.
/// @c assignments is in processing order, not input order.
///
/// @see Allocator::allocate
struct AllocationResult {
    core::Team state;
    std::vector<AssignmentRecord> assignments;
};

} // namespace taskalloc::algo
