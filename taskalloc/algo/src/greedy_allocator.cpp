#include <taskalloc/algo/greedy_allocator.hpp>
#include <taskalloc/algo/error.hpp>
#include <taskalloc/algo/task_order.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace taskalloc::algo {

GreedyAllocator::GreedyAllocator(Scorer scorer)
    : scorer_(std::move(scorer)) {}

AllocationResult GreedyAllocator::allocate(const core::Team& snapshot) {
    AllocationResult result{snapshot, {}};
    core::Team& team = result.state;
    core::reset_workloads(team);

    reset_trace_step();
    trace([&](core::TraceWriter& w) {
        w.type("allocation_start");
        w.field("members", static_cast<uint64_t>(team.member_count()));
        w.field("tasks", static_cast<uint64_t>(team.task_count()));
    });

    auto order = processing_order(team.tasks());
    result.assignments.reserve(order.size());

    for (std::size_t task_idx : order) {
        core::Task& task = team.task(task_idx);
        const double hours = task.estimated_hours();

        core::Member* best_member = nullptr;
        double best_score = -1.0;  // below any achievable score
        std::size_t eligible = 0;

        for (auto& member : team.members()) {
            if (!member.can_take(hours)) {
                continue;
            }
            ++eligible;

            double score = scorer_.score(member, task);
            if (!std::isfinite(score)) {
                throw AllocationError("match score is not finite", task.id(), member.id());
            }
            if (score > best_score) {
                best_member = &member;
                best_score = score;
            }
        }

        AssignmentRecord record;
        record.task_id = task.id();
        record.task_title = task.title();
        record.estimated_hours = hours;

        if (best_member != nullptr && best_score > 0.0) {
            best_member->commit(hours);
            task.assign_to(best_member->id());

            record.member_id = best_member->id();
            record.member_name = best_member->name();
            record.match_score = best_score;

            trace([&](core::TraceWriter& w) {
                w.type("task_assigned");
                w.field("task_id", std::string_view{task.id()});
                w.field("member_id", std::string_view{best_member->id()});
                w.field("score", best_score);
                w.field("hours", hours);
                w.field("workload", best_member->current_workload());
            });
        } else {
            record.member_name = std::string(UNASSIGNED_NAME);
            record.reason = std::string(NO_MEMBER_REASON);

            trace([&](core::TraceWriter& w) {
                w.type("task_unassigned");
                w.field("task_id", std::string_view{task.id()});
                w.field("eligible_members", static_cast<uint64_t>(eligible));
                w.field("reason", NO_MEMBER_REASON);
            });
        }

        result.assignments.push_back(std::move(record));
    }

    trace([&](core::TraceWriter& w) {
        w.type("allocation_end");
        uint64_t assigned = 0;
        for (const auto& record : result.assignments) {
            if (record.is_assigned()) {
                ++assigned;
            }
        }
        w.field("assigned", assigned);
        w.field("unassigned", static_cast<uint64_t>(result.assignments.size()) - assigned);
    });

    return result;
}

} // namespace taskalloc::algo
