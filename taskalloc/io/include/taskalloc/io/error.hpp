#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the taskalloc I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace taskalloc::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown by loader functions when JSON input is malformed, required fields
/// are missing, or values fail semantic validation (e.g. a non-positive
/// capacity or an unknown priority).
///
/// @ingroup io
/// @see load_team, load_team_from_string
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or field name.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace taskalloc::io
