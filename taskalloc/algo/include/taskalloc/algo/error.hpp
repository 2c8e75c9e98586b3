#pragma once

#include <taskalloc/core/error.hpp>

#include <string>

namespace taskalloc::algo {

/// @brief Exception thrown when an allocation run itself fails.
/// @ingroup algo
///
/// Raised for structural problems only, such as a scoring configuration
/// that yields a non-finite match score. A task that no member can take
/// is never an error: it is reported as an unassigned AssignmentRecord.
///
/// Callers can therefore distinguish "zero tasks could be assigned" (a
/// normal AllocationResult) from "the computation failed" (this exception).
///
/// @see Allocator::allocate, Scorer
class AllocationError : public core::TaskAllocError {
public:
    using core::TaskAllocError::TaskAllocError;

    /// @brief Construct an AllocationError naming the offending pair.
    ///
    /// The resulting message is formatted as
    /// `"task '<task_id>', member '<member_id>': message"`.
    ///
    /// @param message   Human-readable description of the error.
    /// @param task_id   Id of the task being allocated.
    /// @param member_id Id of the member being evaluated.
    AllocationError(const std::string& message, const std::string& task_id,
                    const std::string& member_id)
        : core::TaskAllocError("task '" + task_id + "', member '" + member_id + "': " + message)
        , task_id_(task_id)
        , member_id_(member_id) {}

    /// @brief Id of the task being allocated when the error occurred (may be empty).
    [[nodiscard]] const std::string& task_id() const noexcept { return task_id_; }

    /// @brief Id of the member being evaluated when the error occurred (may be empty).
    [[nodiscard]] const std::string& member_id() const noexcept { return member_id_; }

private:
    std::string task_id_;
    std::string member_id_;
};

} // namespace taskalloc::algo
