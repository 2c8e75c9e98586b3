#include <taskalloc/io/team_loader.hpp>
#include <taskalloc/io/error.hpp>

#include <taskalloc/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace taskalloc::io {

namespace {

using namespace taskalloc::core;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

// Ids are strings in the canonical format; integer ids are accepted and
// converted to their decimal representation.
std::string get_id(const rapidjson::Value& val, const std::string& context) {
    const auto& member = get_member(val, "id", context);
    if (member.IsString()) {
        return {member.GetString(), member.GetStringLength()};
    }
    if (member.IsUint64()) {
        return std::to_string(member.GetUint64());
    }
    throw LoaderError("field 'id' must be a string or a non-negative integer", context);
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name,
                                  const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

// Optional getters
double get_double_or(const rapidjson::Value& val, const char* name, double default_val,
                     const std::string& context) {
    if (!val.HasMember(name) || val[name].IsNull()) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

std::string get_string_or(const rapidjson::Value& val, const char* name,
                          const std::string& context) {
    if (!val.HasMember(name) || val[name].IsNull()) {
        return {};
    }
    return get_string(val, name, context);
}

Member::Competencies parse_skills(const rapidjson::Value& member_obj, const std::string& ctx) {
    Member::Competencies skills;
    const auto& value = get_member(member_obj, "skills", ctx);

    if (value.IsObject()) {
        for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
            std::string name{it->name.GetString(), it->name.GetStringLength()};
            if (!it->value.IsNumber()) {
                throw LoaderError("level of skill '" + name + "' must be a number", ctx);
            }
            skills[name] = it->value.GetDouble();
        }
    } else if (value.IsArray()) {
        for (rapidjson::SizeType sidx = 0; sidx < value.Size(); ++sidx) {
            std::string sctx = ctx + ".skills[" + std::to_string(sidx) + "]";
            if (!value[sidx].IsObject()) {
                throw LoaderError("skill entry must be an object", sctx);
            }
            skills[get_string(value[sidx], "name", sctx)] = get_double(value[sidx], "level", sctx);
        }
    } else {
        throw LoaderError("field 'skills' must be an object or an array", ctx);
    }
    return skills;
}

void parse_members(Team& team, const rapidjson::Document& doc) {
    if (!doc.HasMember("members")) {
        return;
    }

    const auto& members = get_array(doc, "members", "team");
    for (rapidjson::SizeType midx = 0; midx < members.Size(); ++midx) {
        const auto& member_obj = members[midx];
        std::string ctx = "members[" + std::to_string(midx) + "]";
        if (!member_obj.IsObject()) {
            throw LoaderError("member entry must be an object", ctx);
        }

        std::string id = get_id(member_obj, ctx);
        std::string name = get_string(member_obj, "name", ctx);
        auto skills = parse_skills(member_obj, ctx);
        double max_capacity = get_double(member_obj, "maxCapacity", ctx);
        double current_workload = get_double_or(member_obj, "currentWorkload", 0.0, ctx);

        try {
            team.add_member(Member(std::move(id), std::move(name), std::move(skills),
                                   max_capacity, current_workload));
        } catch (const TaskAllocError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
}

void parse_tasks(Team& team, const rapidjson::Document& doc) {
    if (!doc.HasMember("tasks")) {
        return;
    }

    const auto& tasks = get_array(doc, "tasks", "team");
    for (rapidjson::SizeType tidx = 0; tidx < tasks.Size(); ++tidx) {
        const auto& task_obj = tasks[tidx];
        std::string ctx = "tasks[" + std::to_string(tidx) + "]";
        if (!task_obj.IsObject()) {
            throw LoaderError("task entry must be an object", ctx);
        }

        std::string id = get_id(task_obj, ctx);
        std::string title = get_string(task_obj, "title", ctx);
        std::string description = get_string_or(task_obj, "description", ctx);

        std::vector<std::string> required;
        const auto& skills = get_array(task_obj, "requiredSkills", ctx);
        for (rapidjson::SizeType sidx = 0; sidx < skills.Size(); ++sidx) {
            if (!skills[sidx].IsString()) {
                throw LoaderError("requiredSkills entries must be strings", ctx);
            }
            required.emplace_back(skills[sidx].GetString(), skills[sidx].GetStringLength());
        }

        double hours = get_double(task_obj, "estimatedHours", ctx);
        std::string priority = get_string(task_obj, "priority", ctx);
        std::string deadline = get_string(task_obj, "deadline", ctx);
        std::string assigned_to = get_string_or(task_obj, "assignedTo", ctx);

        try {
            Task& task = team.add_task(Task(std::move(id), std::move(title), std::move(description),
                                            std::move(required), hours, parse_priority(priority),
                                            parse_date(deadline)));
            if (!assigned_to.empty()) {
                if (team.find_member(assigned_to) == nullptr) {
                    throw LoaderError("assignedTo names unknown member '" + assigned_to + "'", ctx);
                }
                task.assign_to(std::move(assigned_to));
            }
        } catch (const TaskAllocError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
}

} // anonymous namespace

Team load_team(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_team_from_string(oss.str());
}

Team load_team_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "team");
    }

    Team team;
    parse_members(team, doc);
    parse_tasks(team, doc);
    return team;
}

void write_team_to_stream(const Team& team, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("members");
    writer.StartArray();
    for (const auto& member : team.members()) {
        writer.StartObject();
        writer.Key("id");
        writer.String(member.id().c_str(), static_cast<rapidjson::SizeType>(member.id().size()));
        writer.Key("name");
        writer.String(member.name().c_str(), static_cast<rapidjson::SizeType>(member.name().size()));
        writer.Key("skills");
        writer.StartObject();
        for (const auto& [skill, level] : member.competencies()) {
            writer.Key(skill.c_str(), static_cast<rapidjson::SizeType>(skill.size()));
            writer.Double(level);
        }
        writer.EndObject();
        writer.Key("currentWorkload");
        writer.Double(member.current_workload());
        writer.Key("maxCapacity");
        writer.Double(member.max_capacity());
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("tasks");
    writer.StartArray();
    for (const auto& task : team.tasks()) {
        writer.StartObject();
        writer.Key("id");
        writer.String(task.id().c_str(), static_cast<rapidjson::SizeType>(task.id().size()));
        writer.Key("title");
        writer.String(task.title().c_str(), static_cast<rapidjson::SizeType>(task.title().size()));
        writer.Key("description");
        writer.String(task.description().c_str(),
                      static_cast<rapidjson::SizeType>(task.description().size()));
        writer.Key("requiredSkills");
        writer.StartArray();
        for (const auto& skill : task.required_competencies()) {
            writer.String(skill.c_str(), static_cast<rapidjson::SizeType>(skill.size()));
        }
        writer.EndArray();
        writer.Key("estimatedHours");
        writer.Double(task.estimated_hours());
        writer.Key("priority");
        writer.String(std::string(to_string(task.priority())).c_str());
        writer.Key("deadline");
        writer.String(format_date(task.deadline()).c_str());
        writer.Key("assignedTo");
        if (const auto& assigned = task.assigned_member()) {
            writer.String(assigned->c_str(), static_cast<rapidjson::SizeType>(assigned->size()));
        } else {
            writer.Null();
        }
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString();
}

void write_team(const Team& team, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_team_to_stream(team, file);
}

} // namespace taskalloc::io
