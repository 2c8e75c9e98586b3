#pragma once

#include <taskalloc/algo/assignment.hpp>

#include <taskalloc/core/team.hpp>
#include <taskalloc/core/trace_writer.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace taskalloc::algo {

/// @brief Abstract interface for task-to-member allocation.
/// @ingroup algo_allocators
///
/// An Allocator takes an immutable snapshot of a team and returns the new
/// team state together with one AssignmentRecord per task. It keeps no
/// state between runs; callers decide whether to commit the result.
///
/// Concrete implementations decide the assignment strategy (e.g. greedy
/// by priority).
///
/// @see GreedyAllocator, AllocationResult
class Allocator {
public:
    virtual ~Allocator() = default;

    /// @brief Allocate every task of @p snapshot.
    ///
    /// @param snapshot Members and tasks in input order. Not modified.
    /// @return The new team state and the assignment records.
    /// @throws AllocationError if the run cannot be completed.
    [[nodiscard]] virtual AllocationResult allocate(const core::Team& snapshot) = 0;

    /// @brief Allocate and commit the new state into @p team.
    ///
    /// Equivalent to `team = allocate(team).state`, returning the records.
    /// On exception @p team is left untouched.
    ///
    /// @param team The team to allocate and update in place.
    /// @return The assignment records, in processing order.
    std::vector<AssignmentRecord> allocate_in_place(core::Team& team) {
        auto result = allocate(team);
        team = std::move(result.state);
        return std::move(result.assignments);
    }

    /// @brief Set the trace writer that receives allocation decisions.
    /// @param writer Pointer to a TraceWriter, or nullptr to disable tracing.
    void set_trace_writer(core::TraceWriter* writer) noexcept { trace_writer_ = writer; }

protected:
    Allocator() = default;
    Allocator(const Allocator&) = default;
    Allocator& operator=(const Allocator&) = default;
    Allocator(Allocator&&) = default;
    Allocator& operator=(Allocator&&) = default;

    /// @brief Restart the trace step counter at the beginning of a run.
    void reset_trace_step() noexcept { trace_step_ = 0; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    /// @tparam F Callable with signature void(core::TraceWriter&).
    template<typename F>
    void trace(F&& func) {
        if (trace_writer_) {
            trace_writer_->begin(trace_step_++);
            func(*trace_writer_);
            trace_writer_->end();
        }
    }

private:
    core::TraceWriter* trace_writer_{nullptr};
    uint64_t trace_step_{0};
};

} // namespace taskalloc::algo
