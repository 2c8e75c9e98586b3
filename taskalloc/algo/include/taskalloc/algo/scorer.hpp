#pragma once

/// @file scorer.hpp
/// @brief Suitability score of a member for a task.
/// @ingroup algo_scoring

#include <taskalloc/core/member.hpp>
#include <taskalloc/core/task.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace taskalloc::algo {

/// @brief Constants of the scoring function.
///
/// The defaults reproduce the reference scoring: the average matched
/// proficiency is scaled by 10 and a fully loaded member loses 20 points.
///
/// @ingroup algo_scoring
struct ScoringWeights {
    double level_multiplier{10.0};  ///< Scale applied to the average matched level.
    double workload_penalty{20.0};  ///< Points subtracted at a workload ratio of 1.
};

/// @brief Intermediate values of one score computation.
///
/// @ingroup algo_scoring
/// @see Scorer::explain
struct ScoreBreakdown {
    std::size_t matched_count{0};               ///< Required competencies the member holds.
    std::vector<std::string> matched;           ///< Their names, in task order.
    double level_sum{0.0};                      ///< Sum of matched proficiency levels.
    double average_level{0.0};                  ///< level_sum / matched_count (0 if none).
    double workload_ratio{0.0};                 ///< current_workload / max_capacity.
    double penalty{0.0};                        ///< workload_ratio * workload_penalty.
    double score{0.0};                          ///< Final score.
};

/// @brief Computes the suitability of a member for a task.
///
/// For every competency the task requires and the member holds, the
/// member's proficiency level is summed. A member holding none of them
/// scores exactly 0. Otherwise
///
///   score = max(0, average_level * level_multiplier
///                  - workload_ratio * workload_penalty)
///
/// where workload_ratio uses the member's workload *before* the task is
/// applied. The score is not clamped from above: levels beyond 10 can
/// exceed 100.
///
/// A competency listed twice by a task is counted twice.
///
/// Scorer is stateless apart from its weights; scoring has no side effects.
///
/// @ingroup algo_scoring
/// @see GreedyAllocator
class Scorer {
public:
    /// @brief Construct a scorer with the reference weights.
    Scorer() = default;

    /// @brief Construct a scorer with custom weights.
    /// @param weights Scoring constants.
    /// @throws AllocationError if a weight is negative or not finite.
    explicit Scorer(ScoringWeights weights);

    /// @brief Score @p member for @p task.
    /// @return A non-negative score (0 when no required competency matches).
    [[nodiscard]] double score(const core::Member& member, const core::Task& task) const;

    /// @brief Score @p member for @p task and return every intermediate value.
    [[nodiscard]] ScoreBreakdown explain(const core::Member& member, const core::Task& task) const;

    /// @brief Get the weights in use.
    [[nodiscard]] const ScoringWeights& weights() const noexcept { return weights_; }

private:
    ScoringWeights weights_;
};

} // namespace taskalloc::algo
