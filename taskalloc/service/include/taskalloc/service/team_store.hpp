#pragma once

/// @file team_store.hpp
/// @brief In-memory store of the current team with serialized allocation.
/// @ingroup service

#include <taskalloc/algo/allocator.hpp>
#include <taskalloc/io/report.hpp>

#include <taskalloc/core/team.hpp>
#include <taskalloc/core/trace_writer.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace taskalloc::service {

/// @brief Owner of the current members and tasks.
///
/// TeamStore is the collaborator the allocation core relies on: it
/// supplies the current team to the allocator and commits the result.
/// All operations take an internal lock, so allocation runs, resets and
/// roster edits issued from several threads are applied one at a time
/// and an allocation never observes a half-edited team.
///
/// The store holds no durable state; its contents live for the lifetime
/// of the object.
///
/// @ingroup service
/// @see algo::Allocator, io::AllocationReport
class TeamStore {
public:
    /// @brief Construct an empty store using a GreedyAllocator.
    TeamStore();

    /// @brief Construct a store holding @p team.
    /// @param team      Initial members and tasks.
    /// @param allocator Allocation strategy; a GreedyAllocator if null.
    explicit TeamStore(core::Team team, std::unique_ptr<algo::Allocator> allocator = nullptr);

    TeamStore(const TeamStore&) = delete;
    TeamStore& operator=(const TeamStore&) = delete;
    TeamStore(TeamStore&&) = delete;
    TeamStore& operator=(TeamStore&&) = delete;

    /// @brief Copy of the current team.
    [[nodiscard]] core::Team snapshot() const;

    /// @brief Copy of the current members, in input order.
    [[nodiscard]] std::vector<core::Member> members() const;

    /// @brief Copy of the current tasks, in input order.
    [[nodiscard]] std::vector<core::Task> tasks() const;

    /// @brief Replace the whole team.
    void replace(core::Team team);

    /// @brief Add a member.
    /// @throws core::DuplicateIdError if the id is taken.
    void add_member(core::Member member);

    /// @brief Add a task.
    /// @throws core::DuplicateIdError if the id is taken.
    void add_task(core::Task task);

    /// @brief Remove a member; their tasks become unassigned.
    /// @throws core::NotFoundError if no member has this id.
    void remove_member(const std::string& id);

    /// @brief Remove a task.
    /// @throws core::NotFoundError if no task has this id.
    void remove_task(const std::string& id);

    /// @brief Run the allocator on the current team and commit the result.
    ///
    /// On failure the exception propagates and the stored team is left as
    /// it was; no partial result is committed.
    ///
    /// The store lock is held for the whole run, including every call into
    /// the trace writer.
    ///
    /// @return Assignment records, statistics, and member summaries.
    /// @throws algo::AllocationError if the run fails.
    io::AllocationReport allocate();

    /// @brief Zero all workloads and mark all tasks unassigned.
    void reset();

    /// @brief Set the trace writer handed to the allocator.
    ///
    /// The writer is invoked from allocate() while the store lock is held.
    /// It must not call back into this store: any such call, including the
    /// read-only snapshot(), members() and tasks(), deadlocks. The writer
    /// is not owned and must outlive every allocate() that uses it;
    /// pass nullptr to detach it.
    ///
    /// @param writer Trace sink, or nullptr for none.
    void set_trace_writer(core::TraceWriter* writer);

private:
    mutable std::mutex mutex_;
    core::Team team_;
    std::unique_ptr<algo::Allocator> allocator_;
};

} // namespace taskalloc::service
