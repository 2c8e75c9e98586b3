#pragma once

/// @defgroup io I/O Library
/// @brief JSON loading, allocation reports, trace output, and team generation.
///
/// The I/O library handles all external data formats: loading and writing
/// team JSON files, deriving and serialising allocation reports, writing
/// allocation traces (JSON, textual, in-memory), and generating random
/// teams. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Team JSON loader and writer.

/// @defgroup io_report Reports
/// @ingroup io
/// @brief Allocation statistics, member summaries, and report JSON.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers.

/// @defgroup io_generation Generation
/// @ingroup io
/// @brief Random team generation.

// Convenience header for Library 3 (I/O)

#include <taskalloc/io/error.hpp>
#include <taskalloc/io/report.hpp>
#include <taskalloc/io/team_generation.hpp>
#include <taskalloc/io/team_loader.hpp>
#include <taskalloc/io/trace_writers.hpp>
