#pragma once

/// @file task_order.hpp
/// @brief Urgency ordering of tasks for greedy allocation.
/// @ingroup algo_allocators

#include <taskalloc/core/task.hpp>

#include <cstddef>
#include <span>
#include <vector>

namespace taskalloc::algo {

/// @brief Strict weak ordering: true if @p lhs must be processed before @p rhs.
///
/// Higher priority weight first; for equal priority, earlier deadline first.
/// Tasks with equal priority and deadline compare equivalent.
///
/// @see core::priority_weight
[[nodiscard]] bool processed_before(const core::Task& lhs, const core::Task& rhs) noexcept;

/// @brief Compute the order in which tasks are allocated.
///
/// Returns indices into @p tasks sorted by processed_before(). The sort is
/// stable, so equivalent tasks keep their input order.
///
/// @param tasks The tasks in input order.
/// @return A permutation of `[0, tasks.size())`.
[[nodiscard]] std::vector<std::size_t> processing_order(std::span<const core::Task> tasks);

} // namespace taskalloc::algo
