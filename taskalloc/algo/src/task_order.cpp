#include <taskalloc/algo/task_order.hpp>

#include <algorithm>
#include <chrono>
#include <numeric>

namespace taskalloc::algo {

bool processed_before(const core::Task& lhs, const core::Task& rhs) noexcept {
    int lhs_weight = core::priority_weight(lhs.priority());
    int rhs_weight = core::priority_weight(rhs.priority());
    if (lhs_weight != rhs_weight) {
        return lhs_weight > rhs_weight;
    }
    return std::chrono::sys_days{lhs.deadline()} < std::chrono::sys_days{rhs.deadline()};
}

std::vector<std::size_t> processing_order(std::span<const core::Task> tasks) {
    std::vector<std::size_t> order(tasks.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return processed_before(tasks[a], tasks[b]);
    });
    return order;
}

} // namespace taskalloc::algo
