#pragma once

#include <stdexcept>
#include <string>

namespace taskalloc::core {

/// @brief Base exception for all task allocation errors.
///
/// All exceptions thrown by the core and algo libraries derive from this
/// class, allowing callers to catch allocation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidEntityError, DuplicateIdError, NotFoundError
/// @ingroup core
class TaskAllocError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an entity is constructed from malformed values.
///
/// For example, a member with a non-positive maximum capacity, a task
/// with a non-positive effort estimate, an unknown priority name, or a
/// date that does not exist in the calendar.
///
/// @see TaskAllocError
/// @ingroup core
class InvalidEntityError : public TaskAllocError {
public:
    using TaskAllocError::TaskAllocError;
};

/// @brief Thrown when a member or task id is already present in a Team.
///
/// @see Team::add_member, Team::add_task, TaskAllocError
/// @ingroup core
class DuplicateIdError : public TaskAllocError {
public:
    using TaskAllocError::TaskAllocError;
};

/// @brief Thrown when a lookup by id finds no member or task.
///
/// @see TaskAllocError
/// @ingroup core
class NotFoundError : public TaskAllocError {
public:
    using TaskAllocError::TaskAllocError;
};

} // namespace taskalloc::core
