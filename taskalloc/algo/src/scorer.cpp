#include <taskalloc/algo/scorer.hpp>
#include <taskalloc/algo/error.hpp>

#include <algorithm>
#include <cmath>

namespace taskalloc::algo {

Scorer::Scorer(ScoringWeights weights)
    : weights_(weights) {
    if (!std::isfinite(weights_.level_multiplier) || weights_.level_multiplier < 0.0) {
        throw AllocationError("level multiplier must be a non-negative number");
    }
    if (!std::isfinite(weights_.workload_penalty) || weights_.workload_penalty < 0.0) {
        throw AllocationError("workload penalty must be a non-negative number");
    }
}

double Scorer::score(const core::Member& member, const core::Task& task) const {
    double sum = 0.0;
    std::size_t matched = 0;
    for (const auto& competency : task.required_competencies()) {
        if (auto level = member.proficiency(competency)) {
            sum += *level;
            ++matched;
        }
    }

    if (matched == 0) {
        return 0.0;
    }

    double avg_level = sum / static_cast<double>(matched);
    double penalty = member.workload_ratio() * weights_.workload_penalty;
    return std::max(0.0, avg_level * weights_.level_multiplier - penalty);
}

ScoreBreakdown Scorer::explain(const core::Member& member, const core::Task& task) const {
    ScoreBreakdown breakdown;
    for (const auto& competency : task.required_competencies()) {
        if (auto level = member.proficiency(competency)) {
            breakdown.level_sum += *level;
            breakdown.matched.push_back(competency);
        }
    }
    breakdown.matched_count = breakdown.matched.size();
    breakdown.workload_ratio = member.workload_ratio();

    if (breakdown.matched_count == 0) {
        return breakdown;
    }

    breakdown.average_level = breakdown.level_sum / static_cast<double>(breakdown.matched_count);
    breakdown.penalty = breakdown.workload_ratio * weights_.workload_penalty;
    breakdown.score = std::max(0.0, breakdown.average_level * weights_.level_multiplier -
                                        breakdown.penalty);
    return breakdown;
}

} // namespace taskalloc::algo
