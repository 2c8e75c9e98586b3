#pragma once

#include <taskalloc/algo/allocator.hpp>
#include <taskalloc/algo/scorer.hpp>

namespace taskalloc::algo {

/// @brief Greedy priority-ordered allocator.
///
/// Each run starts from a copy of the snapshot with every member's
/// workload at zero and every task unassigned. Tasks are then taken one at
/// a time in processing_order() (priority descending, deadline ascending,
/// input order on ties). For each task the members are scanned in input
/// order:
///
///   - a member whose workload plus the task's hours would exceed their
///     capacity is skipped (filling a member exactly is allowed);
///   - otherwise the member is scored with the Scorer, using the workload
///     committed so far in this run;
///   - a strictly greater score replaces the current best, so the first
///     member reaching a tied maximum wins.
///
/// The task goes to the best member if their score is above zero; the
/// task's hours are committed to that member before the next task is
/// considered. Otherwise the task is recorded as unassigned with the
/// reason NO_MEMBER_REASON. Earlier decisions are never revisited.
///
/// This is a heuristic: it does not maximise total score.
///
/// Trace events: `allocation_start`, one `task_assigned` or
/// `task_unassigned` per task, `allocation_end`.
///
/// @ingroup algo_allocators
/// @see Allocator, Scorer, processing_order
class GreedyAllocator : public Allocator {
public:
    /// @brief Construct an allocator using the reference scoring weights.
    GreedyAllocator() = default;

    /// @brief Construct an allocator with a specific scorer.
    explicit GreedyAllocator(Scorer scorer);

    /// @copydoc Allocator::allocate
    [[nodiscard]] AllocationResult allocate(const core::Team& snapshot) override;

    /// @brief Get the scorer in use.
    [[nodiscard]] const Scorer& scorer() const noexcept { return scorer_; }

private:
    Scorer scorer_;
};

} // namespace taskalloc::algo
