#pragma once

#include <taskalloc/core/member.hpp>
#include <taskalloc/core/task.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace taskalloc::core {

/// @brief Roster of members and tasks, in input order.
/// @ingroup core_model
///
/// A Team is a value: copying it yields an independent snapshot that an
/// allocator can work on without touching the original. Member and task
/// ids are unique within a Team.
///
/// References and pointers returned by the accessors are invalidated by
/// any subsequent add_* or remove_* call.
///
/// @see Member, Task, algo::Allocator
class Team {
public:
    Team() = default;

    /// @brief Append a member.
    /// @param member The member to add.
    /// @return Reference to the stored member.
    /// @throws DuplicateIdError if a member with the same id exists.
    Member& add_member(Member member);

    /// @brief Append a task.
    /// @param task The task to add.
    /// @return Reference to the stored task.
    /// @throws DuplicateIdError if a task with the same id exists.
    Task& add_task(Task task);

    /// @brief Remove the member with @p id.
    ///
    /// Tasks assigned to the removed member are marked unassigned.
    ///
    /// @throws NotFoundError if no member has this id.
    void remove_member(const std::string& id);

    /// @brief Remove the task with @p id.
    /// @throws NotFoundError if no task has this id.
    void remove_task(const std::string& id);

    [[nodiscard]] std::size_t member_count() const noexcept { return members_.size(); }
    [[nodiscard]] std::size_t task_count() const noexcept { return tasks_.size(); }

    [[nodiscard]] Member& member(std::size_t idx) { return members_[idx]; }
    [[nodiscard]] const Member& member(std::size_t idx) const { return members_[idx]; }
    [[nodiscard]] Task& task(std::size_t idx) { return tasks_[idx]; }
    [[nodiscard]] const Task& task(std::size_t idx) const { return tasks_[idx]; }

    [[nodiscard]] std::span<Member> members() noexcept { return members_; }
    [[nodiscard]] std::span<const Member> members() const noexcept { return members_; }
    [[nodiscard]] std::span<Task> tasks() noexcept { return tasks_; }
    [[nodiscard]] std::span<const Task> tasks() const noexcept { return tasks_; }

    /// @brief Find a member by id.
    /// @return Pointer to the member, or @c nullptr if absent.
    [[nodiscard]] Member* find_member(const std::string& id);
    [[nodiscard]] const Member* find_member(const std::string& id) const;

    /// @brief Find a task by id.
    /// @return Pointer to the task, or @c nullptr if absent.
    [[nodiscard]] Task* find_task(const std::string& id);
    [[nodiscard]] const Task* find_task(const std::string& id) const;

private:
    std::vector<Member> members_;
    std::vector<Task> tasks_;
};

/// @brief Zero every member's workload and mark every task unassigned.
///
/// Independent of any allocation run; after this call the team is in the
/// same state as freshly loaded data with no prior assignments.
///
/// @param team The team to reset in place.
/// @ingroup core_model
void reset_workloads(Team& team) noexcept;

} // namespace taskalloc::core
