#include <taskalloc/core/error.hpp>
#include <taskalloc/core/team.hpp>

#include <taskalloc/algo/error.hpp>
#include <taskalloc/algo/greedy_allocator.hpp>
#include <taskalloc/algo/scorer.hpp>

#include <taskalloc/io/error.hpp>
#include <taskalloc/io/report.hpp>
#include <taskalloc/io/team_loader.hpp>
#include <taskalloc/io/trace_writers.hpp>

#include <taskalloc/service/team_store.hpp>

#include <cxxopts.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace {

namespace core = taskalloc::core;
namespace algo = taskalloc::algo;
namespace io = taskalloc::io;
namespace service = taskalloc::service;

constexpr const char* VERSION = "1.0.0";
constexpr int EXIT_USAGE = 64;

struct Config {
    std::string command;
    std::string input_file;
    std::string output_file{"-"};
    std::string state_file;
    std::string trace{"none"};
    std::string trace_file{"-"};
    std::string member_id;
    std::string task_id;
    algo::ScoringWeights weights;
    bool verbose{false};
};

[[noreturn]] void usage_error(const std::string& message) {
    std::cerr << "Error: " << message << std::endl;
    std::exit(EXIT_USAGE);
}

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("taskalloc", "Skill-based task allocator");
    options.positional_help("<allocate|reset|score|validate|health>");

    // clang-format off
    options.add_options()
        ("command", "Command to run", cxxopts::value<std::string>())
        ("i,input", "Team file (JSON)", cxxopts::value<std::string>())
        ("o,output", "Output file (default: stdout)",
            cxxopts::value<std::string>()->default_value("-"))
        ("state", "allocate: also write the committed team to this file",
            cxxopts::value<std::string>())
        ("trace", "allocate: trace format none|json|text (default: none)",
            cxxopts::value<std::string>()->default_value("none"))
        ("trace-output", "Trace output (default: stderr)",
            cxxopts::value<std::string>()->default_value("-"))
        ("m,member", "score: member id", cxxopts::value<std::string>())
        ("t,task", "score: task id", cxxopts::value<std::string>())
        ("level-multiplier", "Scale of the average matched level (default: 10)",
            cxxopts::value<double>()->default_value("10"))
        ("penalty-weight", "Score penalty at full workload (default: 20)",
            cxxopts::value<double>()->default_value("20"))
        ("v,verbose", "Verbose stderr output")
        ("version", "Print version")
        ("h,help", "Show help");
    // clang-format on

    options.parse_positional({"command"});
    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }
    if (result.count("version") != 0U) {
        std::cout << "taskalloc " << VERSION << std::endl;
        std::exit(0);
    }
    if (result.count("command") == 0U) {
        usage_error("a command is required (allocate, reset, score, validate, health)");
    }

    Config config;
    config.command = result["command"].as<std::string>();
    config.output_file = result["output"].as<std::string>();
    config.trace = result["trace"].as<std::string>();
    config.trace_file = result["trace-output"].as<std::string>();
    config.weights.level_multiplier = result["level-multiplier"].as<double>();
    config.weights.workload_penalty = result["penalty-weight"].as<double>();
    config.verbose = result.count("verbose") != 0U;

    if (config.command != "allocate" && config.command != "reset" &&
        config.command != "score" && config.command != "validate" &&
        config.command != "health") {
        usage_error("unknown command: " + config.command);
    }
    if (config.command != "health") {
        if (result.count("input") == 0U) {
            usage_error("--input is required");
        }
        config.input_file = result["input"].as<std::string>();
    }
    if (config.trace != "none" && config.trace != "json" && config.trace != "text") {
        usage_error("--trace must be 'none', 'json' or 'text'");
    }
    if (result.count("state") != 0U) {
        config.state_file = result["state"].as<std::string>();
    }
    if (config.command == "score") {
        if (result.count("member") == 0U || result.count("task") == 0U) {
            usage_error("score requires --member and --task");
        }
        config.member_id = result["member"].as<std::string>();
        config.task_id = result["task"].as<std::string>();
    }

    return config;
}

// Stream for command output: stdout for "-", otherwise the opened file.
class Output {
public:
    explicit Output(const std::string& path) {
        if (path != "-") {
            file_.open(path);
            if (!file_) {
                throw io::LoaderError("cannot open output file", path);
            }
        }
    }

    std::ostream& stream() { return file_.is_open() ? file_ : std::cout; }

private:
    std::ofstream file_;
};

std::string iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

int run_health(const Config& config) {
    Output out(config.output_file);
    io::write_health_to_stream(out.stream(), iso_timestamp());
    out.stream() << std::endl;
    return 0;
}

int run_validate(const Config& config, const core::Team& team) {
    std::size_t assigned = 0;
    for (const auto& task : team.tasks()) {
        if (task.is_assigned()) {
            ++assigned;
        }
    }

    Output out(config.output_file);
    out.stream() << config.input_file << ": " << team.member_count() << " members, "
                 << team.task_count() << " tasks (" << assigned << " assigned)" << std::endl;
    return 0;
}

int run_reset(const Config& config, core::Team team) {
    core::reset_workloads(team);
    Output out(config.output_file);
    io::write_team_to_stream(team, out.stream());
    out.stream() << std::endl;
    return 0;
}

int run_score(const Config& config, const core::Team& team) {
    const core::Member* member = team.find_member(config.member_id);
    if (member == nullptr) {
        throw core::NotFoundError("no member with id '" + config.member_id + "'");
    }
    const core::Task* task = team.find_task(config.task_id);
    if (task == nullptr) {
        throw core::NotFoundError("no task with id '" + config.task_id + "'");
    }

    algo::Scorer scorer(config.weights);
    auto breakdown = scorer.explain(*member, *task);

    Output out(config.output_file);
    auto& os = out.stream();
    os << "member:         " << member->id() << " (" << member->name() << ")\n"
       << "task:           " << task->id() << " (" << task->title() << ")\n"
       << "matched:        " << breakdown.matched_count << "/"
       << task->required_competencies().size();
    for (std::size_t i = 0; i < breakdown.matched.size(); ++i) {
        os << (i == 0 ? " [" : ", ") << breakdown.matched[i];
    }
    os << (breakdown.matched.empty() ? "" : "]") << "\n"
       << "average level:  " << breakdown.average_level << "\n"
       << "workload ratio: " << breakdown.workload_ratio << "\n"
       << "penalty:        " << breakdown.penalty << "\n"
       << "score:          " << breakdown.score << "\n"
       << "fits capacity:  " << (member->can_take(task->estimated_hours()) ? "yes" : "no")
       << std::endl;
    return 0;
}

int run_allocate(const Config& config, core::Team team) {
    io::TraceOutput trace(config.trace, config.trace_file);
    service::TeamStore store(std::move(team),
                             std::make_unique<algo::GreedyAllocator>(algo::Scorer(config.weights)));
    store.set_trace_writer(trace.writer());

    if (config.verbose) {
        std::cerr << "Allocating..." << std::endl;
    }

    auto report = store.allocate();

    if (config.verbose) {
        std::cerr << "Assigned " << report.stats.assigned_tasks << "/"
                  << report.stats.total_tasks << " tasks (efficiency "
                  << report.stats.efficiency << "%)" << std::endl;
    }

    Output out(config.output_file);
    io::write_report_to_stream(report, out.stream());
    out.stream() << std::endl;

    if (!config.state_file.empty()) {
        if (config.verbose) {
            std::cerr << "Writing team state to: " << config.state_file << std::endl;
        }
        io::write_team(store.snapshot(), config.state_file);
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        if (config.command == "health") {
            return run_health(config);
        }

        if (config.verbose) {
            std::cerr << "Loading team from: " << config.input_file << std::endl;
        }
        auto team = io::load_team(config.input_file);

        if (config.command == "validate") {
            return run_validate(config, team);
        }
        if (config.command == "reset") {
            return run_reset(config, std::move(team));
        }
        if (config.command == "score") {
            return run_score(config, team);
        }
        return run_allocate(config, std::move(team));
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const algo::AllocationError& e) {
        std::cerr << "Allocation failed: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return EXIT_USAGE;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
