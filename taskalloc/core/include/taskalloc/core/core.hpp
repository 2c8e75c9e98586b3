#pragma once

/// @defgroup core Core Library
/// @brief Team model: members, tasks, priorities, dates, and trace output.
///
/// The core library provides the entities the allocation algorithms work
/// on: members with rated competencies and a bounded capacity, tasks with
/// required competencies, priority and deadline, and the Team roster that
/// owns both. It has no dependencies on allocation algorithms or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Priority and calendar-date value types.

/// @defgroup core_model Team Model
/// @ingroup core
/// @brief Member, Task, and Team.

// Convenience header for Library 1
#include <taskalloc/core/types.hpp>
#include <taskalloc/core/error.hpp>
#include <taskalloc/core/trace_writer.hpp>

#include <taskalloc/core/member.hpp>
#include <taskalloc/core/task.hpp>
#include <taskalloc/core/team.hpp>
