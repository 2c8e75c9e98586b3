#pragma once

/// @defgroup algo Algo Library
/// @brief Scoring and task-to-member allocation strategies.
///
/// The algo library implements allocation on top of the core team model:
/// the per-(member, task) suitability Scorer, the urgency ordering of
/// tasks, and the greedy allocator that assigns each task to the best
/// eligible member under capacity constraints. Depends on core only.

/// @defgroup algo_scoring Scoring
/// @ingroup algo
/// @brief Suitability score and its weights.

/// @defgroup algo_allocators Allocators
/// @ingroup algo
/// @brief Task ordering, allocation results, and allocators.

// Convenience header for Library 2 (libtaskalloc-algo)

#include <taskalloc/algo/allocator.hpp>
#include <taskalloc/algo/assignment.hpp>
#include <taskalloc/algo/error.hpp>
#include <taskalloc/algo/greedy_allocator.hpp>
#include <taskalloc/algo/scorer.hpp>
#include <taskalloc/algo/task_order.hpp>
