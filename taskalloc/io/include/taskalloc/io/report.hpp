#pragma once

/// @file report.hpp
/// @brief Caller-facing allocation report: statistics and member summaries.
///
/// Derives the summary figures of an allocation run from its assignment
/// records and the resulting team state, and serialises the whole report
/// as JSON with the field names used by the allocation API.
///
/// @ingroup io_report

#include <taskalloc/algo/assignment.hpp>

#include <taskalloc/core/team.hpp>

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace taskalloc::io {

/// @brief Aggregate statistics over the assignment records of one run.
///
/// @ingroup io_report
/// @see build_report
struct AllocationStats {
    uint64_t total_tasks{0};       ///< Number of records.
    uint64_t assigned_tasks{0};    ///< Records with a member id.
    uint64_t unassigned_tasks{0};  ///< total_tasks - assigned_tasks.
    int64_t avg_match_score{0};    ///< Rounded mean of the reported scores (0 if none).
    int64_t efficiency{0};         ///< Rounded assigned / total percentage (0 if no tasks).
};

/// @brief Workload figures of one member after a run.
///
/// @ingroup io_report
/// @see build_report
struct MemberSummary {
    std::string id;              ///< Member id.
    std::string name;            ///< Member display name.
    double current_workload{0};  ///< Hours committed.
    double max_capacity{0};      ///< Capacity in hours.
    int64_t utilization{0};      ///< Rounded current_workload / max_capacity percentage.
};

/// @brief Everything returned to the caller of an allocation.
///
/// @ingroup io_report
/// @see build_report, write_report_to_stream
struct AllocationReport {
    std::vector<algo::AssignmentRecord> assignments;  ///< In processing order.
    AllocationStats stats;                            ///< Derived statistics.
    std::vector<MemberSummary> member_summaries;      ///< One per member, in input order.
};

/// @brief Compute statistics over a set of assignment records.
///
/// The average is taken over the scores as they appear in the report,
/// i.e. each record's @ref reported_score, so it always agrees with the
/// listed `matchScore` values.
///
/// @param assignments The records of one run.
/// @return The derived statistics.
AllocationStats compute_stats(std::span<const algo::AssignmentRecord> assignments);

/// @brief Summarise every member's workload, including members without work.
///
/// @param team Team state after the run.
/// @return One summary per member, in input order.
std::vector<MemberSummary> summarize_members(const core::Team& team);

/// @brief Build the full report of an allocation run.
///
/// @param result The allocator's result.
/// @return Records, statistics, and member summaries.
AllocationReport build_report(const algo::AllocationResult& result);

/// @brief Round a non-negative ratio expressed as a percentage.
///
/// @return `round(numerator / denominator * 100)`, or 0 if @p denominator is 0.
int64_t rounded_percentage(double numerator, double denominator) noexcept;

/// @brief A match score as written to the report: rounded half away from zero.
int64_t reported_score(double score) noexcept;

/// @brief Write a report as JSON to an output stream.
///
/// Scores are written rounded to the nearest integer. Unassigned records
/// carry `"memberId": null` and a `"reason"` field.
///
/// @param report The report to serialise.
/// @param out    Destination stream.
void write_report_to_stream(const AllocationReport& report, std::ostream& out);

/// @brief Write a report as JSON to a file.
///
/// @throws LoaderError  If the file cannot be opened for writing.
void write_report(const AllocationReport& report, const std::filesystem::path& path);

/// @brief Write the service status document.
///
/// Produces `{"message": "Smart Task Allocator API is running!", "timestamp": ...}`.
///
/// @param out        Destination stream.
/// @param timestamp  ISO-8601 UTC time of the check.
void write_health_to_stream(std::ostream& out, std::string_view timestamp);

} // namespace taskalloc::io
