#include <taskalloc/io/report.hpp>
#include <taskalloc/io/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <fstream>

namespace taskalloc::io {

namespace {

void write_string(rapidjson::Writer<rapidjson::StringBuffer>& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

} // anonymous namespace

int64_t rounded_percentage(double numerator, double denominator) noexcept {
    if (denominator == 0.0) {
        return 0;
    }
    return static_cast<int64_t>(std::llround(numerator / denominator * 100.0));
}

int64_t reported_score(double score) noexcept {
    return static_cast<int64_t>(std::llround(score));
}

AllocationStats compute_stats(std::span<const algo::AssignmentRecord> assignments) {
    AllocationStats stats;
    stats.total_tasks = assignments.size();

    double score_sum = 0.0;
    for (const auto& record : assignments) {
        if (record.is_assigned()) {
            ++stats.assigned_tasks;
            score_sum += static_cast<double>(reported_score(record.match_score));
        }
    }
    stats.unassigned_tasks = stats.total_tasks - stats.assigned_tasks;

    if (stats.assigned_tasks > 0) {
        stats.avg_match_score = static_cast<int64_t>(
            std::llround(score_sum / static_cast<double>(stats.assigned_tasks)));
    }
    stats.efficiency = rounded_percentage(static_cast<double>(stats.assigned_tasks),
                                          static_cast<double>(stats.total_tasks));
    return stats;
}

std::vector<MemberSummary> summarize_members(const core::Team& team) {
    std::vector<MemberSummary> summaries;
    summaries.reserve(team.member_count());
    for (const auto& member : team.members()) {
        summaries.push_back(MemberSummary{
            member.id(),
            member.name(),
            member.current_workload(),
            member.max_capacity(),
            rounded_percentage(member.current_workload(), member.max_capacity())
        });
    }
    return summaries;
}

AllocationReport build_report(const algo::AllocationResult& result) {
    AllocationReport report;
    report.assignments = result.assignments;
    report.stats = compute_stats(report.assignments);
    report.member_summaries = summarize_members(result.state);
    return report;
}

void write_report_to_stream(const AllocationReport& report, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("assignments");
    writer.StartArray();
    for (const auto& record : report.assignments) {
        writer.StartObject();
        writer.Key("taskId");
        write_string(writer, record.task_id);
        writer.Key("taskTitle");
        write_string(writer, record.task_title);
        writer.Key("memberId");
        if (record.member_id) {
            write_string(writer, *record.member_id);
        } else {
            writer.Null();
        }
        writer.Key("memberName");
        write_string(writer, record.member_name);
        writer.Key("matchScore");
        writer.Int64(reported_score(record.match_score));
        writer.Key("estimatedHours");
        writer.Double(record.estimated_hours);
        if (record.reason) {
            writer.Key("reason");
            write_string(writer, *record.reason);
        }
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("stats");
    writer.StartObject();
    writer.Key("totalTasks");
    writer.Uint64(report.stats.total_tasks);
    writer.Key("assignedTasks");
    writer.Uint64(report.stats.assigned_tasks);
    writer.Key("unassignedTasks");
    writer.Uint64(report.stats.unassigned_tasks);
    writer.Key("avgMatchScore");
    writer.Int64(report.stats.avg_match_score);
    writer.Key("efficiency");
    writer.Int64(report.stats.efficiency);
    writer.EndObject();

    writer.Key("memberSummaries");
    writer.StartArray();
    for (const auto& summary : report.member_summaries) {
        writer.StartObject();
        writer.Key("id");
        write_string(writer, summary.id);
        writer.Key("name");
        write_string(writer, summary.name);
        writer.Key("currentWorkload");
        writer.Double(summary.current_workload);
        writer.Key("maxCapacity");
        writer.Double(summary.max_capacity);
        writer.Key("utilization");
        writer.Int64(summary.utilization);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString();
}

void write_report(const AllocationReport& report, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_report_to_stream(report, file);
}

void write_health_to_stream(std::ostream& out, std::string_view timestamp) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("message");
    writer.String("Smart Task Allocator API is running!");
    writer.Key("timestamp");
    writer.String(timestamp.data(), static_cast<rapidjson::SizeType>(timestamp.size()));
    writer.EndObject();

    out << buffer.GetString();
}

} // namespace taskalloc::io
