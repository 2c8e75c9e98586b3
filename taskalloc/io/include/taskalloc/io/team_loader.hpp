#pragma once

/// @file team_loader.hpp
/// @brief Functions for loading and writing JSON team files.
/// @ingroup io_loaders

#include <taskalloc/core/team.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace taskalloc::io {

/// @brief Load a team (members and tasks) from a JSON file.
///
/// The root object holds a `"members"` array and a `"tasks"` array, both
/// optional. Members carry `id`, `name`, `skills`, `maxCapacity` and an
/// optional `currentWorkload`; `skills` is either an object mapping names
/// to levels or an array of `{"name", "level"}` objects. Tasks carry `id`,
/// `title`, `requiredSkills`, `estimatedHours`, `priority`
/// (`high|medium|low`), `deadline` (`YYYY-MM-DD`), and optional
/// `description` and `assignedTo`. Ids may be strings or non-negative
/// integers.
///
/// @param path  Filesystem path to the JSON team file.
/// @return Parsed team, in file order.
///
/// @throws LoaderError  If the file cannot be read, contains invalid JSON,
///                      or an entity fails validation.
///
/// @see load_team_from_string, write_team
core::Team load_team(const std::filesystem::path& path);

/// @brief Load a team from a JSON string.
///
/// @param json  JSON content describing the team.
/// @return Parsed team.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
///
/// @see load_team
core::Team load_team_from_string(std::string_view json);

/// @brief Write a team to a JSON file.
///
/// Serialises @p team to the same format load_team() reads, with `skills`
/// as an object and `assignedTo` as a member id or null.
///
/// @param team  The team to serialise.
/// @param path  Destination file path.
///
/// @throws LoaderError  If the file cannot be opened for writing.
///
/// @see write_team_to_stream
void write_team(const core::Team& team, const std::filesystem::path& path);

/// @brief Write a team to an output stream.
///
/// @param team  The team to serialise.
/// @param out   Output stream (file, stringstream, stdout, etc.).
///
/// @see write_team
void write_team_to_stream(const core::Team& team, std::ostream& out);

} // namespace taskalloc::io
