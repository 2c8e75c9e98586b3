#include <taskalloc/algo/greedy_allocator.hpp>
#include <taskalloc/algo/error.hpp>

#include <taskalloc/core/team.hpp>
#include <taskalloc/core/trace_writer.hpp>

#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace taskalloc::algo;
using namespace taskalloc::core;

namespace {

Task make_task(const std::string& id, std::vector<std::string> skills, double hours,
               Priority priority = Priority::Medium,
               CalendarDate deadline = make_date(2025, 1, 15)) {
    return Task(id, "Task " + id, "", std::move(skills), hours, priority, deadline);
}

// Records every traced event
class RecordingWriter : public TraceWriter {
public:
    struct Event {
        uint64_t step{0};
        std::string type;
        std::map<std::string, std::string> strings;
        std::map<std::string, double> numbers;
    };

    void begin(uint64_t step) override { current_ = Event{}; current_.step = step; }
    void type(std::string_view name) override { current_.type = name; }
    void field(std::string_view key, double value) override {
        current_.numbers[std::string(key)] = value;
    }
    void field(std::string_view key, uint64_t value) override {
        current_.numbers[std::string(key)] = static_cast<double>(value);
    }
    void field(std::string_view key, std::string_view value) override {
        current_.strings[std::string(key)] = value;
    }
    void end() override { events.push_back(current_); }

    std::vector<Event> events;

private:
    Event current_;
};

const AssignmentRecord& record_for(const std::vector<AssignmentRecord>& records,
                                   const std::string& task_id) {
    for (const auto& record : records) {
        if (record.task_id == task_id) {
            return record;
        }
    }
    throw std::out_of_range("no record for " + task_id);
}

} // anonymous namespace

class GreedyAllocatorTest : public ::testing::Test {
protected:
    GreedyAllocator allocator_;
};

TEST_F(GreedyAllocatorTest, SingleMatchingTask) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}, {"JavaScript", 9}, {"CSS", 7}}, 40.0));
    team.add_task(make_task("1", {"React", "JavaScript"}, 8.0, Priority::High));

    auto result = allocator_.allocate(team);

    ASSERT_EQ(result.assignments.size(), 1U);
    const auto& record = result.assignments[0];
    EXPECT_EQ(record.task_id, "1");
    EXPECT_EQ(record.task_title, "Task 1");
    ASSERT_TRUE(record.member_id.has_value());
    EXPECT_EQ(*record.member_id, "1");
    EXPECT_EQ(record.member_name, "Alice");
    EXPECT_DOUBLE_EQ(record.match_score, 85.0);
    EXPECT_DOUBLE_EQ(record.estimated_hours, 8.0);
    EXPECT_FALSE(record.reason.has_value());

    EXPECT_DOUBLE_EQ(result.state.member(0).current_workload(), 8.0);
    ASSERT_TRUE(result.state.task(0).assigned_member().has_value());
    EXPECT_EQ(*result.state.task(0).assigned_member(), "1");
}

TEST_F(GreedyAllocatorTest, UnmatchedTaskIsReportedUnassigned) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}}, 40.0));
    team.add_task(make_task("1", {"Rust"}, 4.0));

    auto result = allocator_.allocate(team);

    ASSERT_EQ(result.assignments.size(), 1U);
    const auto& record = result.assignments[0];
    EXPECT_FALSE(record.is_assigned());
    EXPECT_EQ(record.member_name, UNASSIGNED_NAME);
    EXPECT_EQ(record.match_score, 0.0);
    ASSERT_TRUE(record.reason.has_value());
    EXPECT_EQ(*record.reason, NO_MEMBER_REASON);
    EXPECT_DOUBLE_EQ(result.state.member(0).current_workload(), 0.0);
    EXPECT_FALSE(result.state.task(0).is_assigned());
}

TEST_F(GreedyAllocatorTest, TaskWithoutRequirementsIsUnassigned) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}}, 40.0));
    team.add_task(make_task("1", {}, 2.0));

    auto result = allocator_.allocate(team);

    EXPECT_FALSE(result.assignments[0].is_assigned());
}

TEST_F(GreedyAllocatorTest, EmptyTeam) {
    Team team;
    team.add_task(make_task("1", {"React"}, 2.0));

    auto result = allocator_.allocate(team);

    ASSERT_EQ(result.assignments.size(), 1U);
    EXPECT_FALSE(result.assignments[0].is_assigned());

    Team nothing;
    EXPECT_TRUE(allocator_.allocate(nothing).assignments.empty());
}

TEST_F(GreedyAllocatorTest, CapacityExcludesBestScorer) {
    Team team;
    team.add_member(Member("1", "Expert", {{"React", 10}}, 5.0));
    team.add_member(Member("2", "Junior", {{"React", 3}}, 40.0));
    team.add_task(make_task("1", {"React"}, 8.0));

    auto result = allocator_.allocate(team);

    ASSERT_TRUE(result.assignments[0].member_id.has_value());
    EXPECT_EQ(*result.assignments[0].member_id, "2");
    EXPECT_DOUBLE_EQ(result.state.member(0).current_workload(), 0.0);
}

TEST_F(GreedyAllocatorTest, ExactFillIsAllowed) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}}, 8.0));
    team.add_task(make_task("1", {"React"}, 8.0));

    auto result = allocator_.allocate(team);

    EXPECT_TRUE(result.assignments[0].is_assigned());
    EXPECT_DOUBLE_EQ(result.state.member(0).current_workload(), 8.0);
}

TEST_F(GreedyAllocatorTest, NeverExceedsCapacity) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 9}, {"CSS", 6}}, 20.0));
    team.add_member(Member("2", "Bob", {{"React", 5}, {"Python", 8}}, 12.0));
    for (int i = 0; i < 12; ++i) {
        team.add_task(make_task("t" + std::to_string(i), {"React"}, 3.0 + (i % 3)));
    }

    auto result = allocator_.allocate(team);

    std::map<std::string, double> assigned_hours;
    for (const auto& record : result.assignments) {
        if (record.is_assigned()) {
            assigned_hours[*record.member_id] += record.estimated_hours;
        }
    }
    for (const auto& member : result.state.members()) {
        EXPECT_LE(member.current_workload(), member.max_capacity());
        EXPECT_DOUBLE_EQ(member.current_workload(), assigned_hours[member.id()]);
    }
}

TEST_F(GreedyAllocatorTest, TieGoesToFirstMember) {
    Team team;
    team.add_member(Member("1", "First", {{"Go", 7}}, 40.0));
    team.add_member(Member("2", "Second", {{"Go", 7}}, 40.0));
    team.add_task(make_task("1", {"Go"}, 4.0));

    auto result = allocator_.allocate(team);

    ASSERT_TRUE(result.assignments[0].member_id.has_value());
    EXPECT_EQ(*result.assignments[0].member_id, "1");
}

TEST_F(GreedyAllocatorTest, WorkloadPenaltySpreadsLaterTasks) {
    Team team;
    team.add_member(Member("1", "Alice", {{"Go", 8}}, 10.0));
    team.add_member(Member("2", "Bob", {{"Go", 7}}, 10.0));
    team.add_task(make_task("1", {"Go"}, 5.0, Priority::High));
    team.add_task(make_task("2", {"Go"}, 2.0, Priority::Low));

    auto result = allocator_.allocate(team);

    // Alice wins first at 80; afterwards she scores 80 - 10 = 70 against Bob's 70,
    // and the tie goes to her as the first member.
    EXPECT_EQ(*record_for(result.assignments, "1").member_id, "1");
    EXPECT_EQ(*record_for(result.assignments, "2").member_id, "1");

    Team heavier;
    heavier.add_member(Member("1", "Alice", {{"Go", 8}}, 10.0));
    heavier.add_member(Member("2", "Bob", {{"Go", 7}}, 10.0));
    heavier.add_task(make_task("1", {"Go"}, 6.0, Priority::High));
    heavier.add_task(make_task("2", {"Go"}, 2.0, Priority::Low));

    auto spread = allocator_.allocate(heavier);

    // After 6h Alice scores 80 - 12 = 68, below Bob's 70
    EXPECT_EQ(*record_for(spread.assignments, "1").member_id, "1");
    EXPECT_EQ(*record_for(spread.assignments, "2").member_id, "2");
    EXPECT_DOUBLE_EQ(record_for(spread.assignments, "2").match_score, 70.0);
}

TEST_F(GreedyAllocatorTest, RecordsFollowProcessingOrder) {
    Team team;
    team.add_member(Member("1", "Alice", {{"Go", 8}}, 100.0));
    team.add_task(make_task("low", {"Go"}, 1.0, Priority::Low, make_date(2025, 1, 1)));
    team.add_task(make_task("high", {"Go"}, 1.0, Priority::High, make_date(2025, 6, 1)));
    team.add_task(make_task("med", {"Go"}, 1.0, Priority::Medium, make_date(2025, 3, 1)));

    auto result = allocator_.allocate(team);

    ASSERT_EQ(result.assignments.size(), 3U);
    EXPECT_EQ(result.assignments[0].task_id, "high");
    EXPECT_EQ(result.assignments[1].task_id, "med");
    EXPECT_EQ(result.assignments[2].task_id, "low");

    // The state keeps input order
    EXPECT_EQ(result.state.task(0).id(), "low");
}

TEST_F(GreedyAllocatorTest, HigherPriorityClaimsScarceCapacity) {
    Team team;
    team.add_member(Member("1", "Alice", {{"Go", 8}}, 8.0));
    team.add_task(make_task("low", {"Go"}, 8.0, Priority::Low, make_date(2025, 1, 1)));
    team.add_task(make_task("high", {"Go"}, 8.0, Priority::High, make_date(2025, 12, 1)));

    auto result = allocator_.allocate(team);

    EXPECT_TRUE(record_for(result.assignments, "high").is_assigned());
    EXPECT_FALSE(record_for(result.assignments, "low").is_assigned());
}

TEST_F(GreedyAllocatorTest, StartsFromZeroWorkload) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}}, 10.0, 10.0));
    team.add_task(make_task("1", {"React"}, 4.0));
    team.find_task("1")->assign_to("1");

    auto result = allocator_.allocate(team);

    EXPECT_TRUE(result.assignments[0].is_assigned());
    EXPECT_DOUBLE_EQ(result.assignments[0].match_score, 80.0);
    EXPECT_DOUBLE_EQ(result.state.member(0).current_workload(), 4.0);
}

TEST_F(GreedyAllocatorTest, SnapshotIsNotModified) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}}, 40.0, 3.0));
    team.add_task(make_task("1", {"React"}, 8.0));

    auto result = allocator_.allocate(team);

    EXPECT_DOUBLE_EQ(team.member(0).current_workload(), 3.0);
    EXPECT_FALSE(team.task(0).is_assigned());
    EXPECT_DOUBLE_EQ(result.state.member(0).current_workload(), 8.0);
}

TEST_F(GreedyAllocatorTest, IsDeterministicAndIdempotent) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}, {"CSS", 5}}, 20.0));
    team.add_member(Member("2", "Bob", {{"React", 6}, {"Python", 9}}, 15.0));
    team.add_member(Member("3", "Carol", {{"Python", 7}, {"CSS", 8}}, 10.0));
    team.add_task(make_task("1", {"React"}, 6.0, Priority::High));
    team.add_task(make_task("2", {"Python"}, 5.0, Priority::Medium));
    team.add_task(make_task("3", {"CSS", "React"}, 4.0, Priority::Low));
    team.add_task(make_task("4", {"Python", "CSS"}, 7.0, Priority::High));

    auto first = allocator_.allocate(team);
    auto second = allocator_.allocate(team);
    // Re-running on a committed state gives the same outcome
    auto third = allocator_.allocate(first.state);

    for (const auto* other : {&second, &third}) {
        ASSERT_EQ(other->assignments.size(), first.assignments.size());
        for (std::size_t i = 0; i < first.assignments.size(); ++i) {
            EXPECT_EQ(other->assignments[i].task_id, first.assignments[i].task_id);
            EXPECT_EQ(other->assignments[i].member_id, first.assignments[i].member_id);
            EXPECT_DOUBLE_EQ(other->assignments[i].match_score, first.assignments[i].match_score);
        }
        for (std::size_t i = 0; i < first.state.member_count(); ++i) {
            EXPECT_DOUBLE_EQ(other->state.member(i).current_workload(),
                             first.state.member(i).current_workload());
        }
    }
}

TEST_F(GreedyAllocatorTest, AllocateInPlaceCommitsState) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}}, 40.0));
    team.add_task(make_task("1", {"React"}, 8.0));

    auto records = allocator_.allocate_in_place(team);

    ASSERT_EQ(records.size(), 1U);
    EXPECT_TRUE(records[0].is_assigned());
    EXPECT_DOUBLE_EQ(team.member(0).current_workload(), 8.0);
    EXPECT_TRUE(team.task(0).is_assigned());
}

TEST_F(GreedyAllocatorTest, CustomWeightsChangeTheWinner) {
    Team team;
    team.add_member(Member("1", "Busy", {{"Go", 9}}, 10.0, 0.0));
    team.add_member(Member("2", "Free", {{"Go", 6}}, 10.0, 0.0));
    team.add_task(make_task("a", {"Go"}, 5.0, Priority::High));
    team.add_task(make_task("b", {"Go"}, 1.0, Priority::Low));

    // Heavy penalty: after 5h Busy scores 90 - 0.5 * 100 = 40, Free scores 60
    GreedyAllocator allocator(Scorer(ScoringWeights{10.0, 100.0}));
    auto result = allocator.allocate(team);

    EXPECT_EQ(*record_for(result.assignments, "a").member_id, "1");
    EXPECT_EQ(*record_for(result.assignments, "b").member_id, "2");
}

TEST_F(GreedyAllocatorTest, TracesEvents) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 8}}, 40.0));
    team.add_task(make_task("1", {"React"}, 8.0, Priority::High));
    team.add_task(make_task("2", {"Rust"}, 2.0, Priority::Low));

    RecordingWriter writer;
    allocator_.set_trace_writer(&writer);
    (void)allocator_.allocate(team);

    ASSERT_EQ(writer.events.size(), 4U);
    EXPECT_EQ(writer.events[0].type, "allocation_start");
    EXPECT_DOUBLE_EQ(writer.events[0].numbers["members"], 1.0);
    EXPECT_DOUBLE_EQ(writer.events[0].numbers["tasks"], 2.0);

    EXPECT_EQ(writer.events[1].type, "task_assigned");
    EXPECT_EQ(writer.events[1].strings["task_id"], "1");
    EXPECT_EQ(writer.events[1].strings["member_id"], "1");
    EXPECT_DOUBLE_EQ(writer.events[1].numbers["score"], 80.0);
    EXPECT_DOUBLE_EQ(writer.events[1].numbers["workload"], 8.0);

    EXPECT_EQ(writer.events[2].type, "task_unassigned");
    EXPECT_EQ(writer.events[2].strings["task_id"], "2");
    EXPECT_DOUBLE_EQ(writer.events[2].numbers["eligible_members"], 1.0);

    EXPECT_EQ(writer.events[3].type, "allocation_end");
    EXPECT_DOUBLE_EQ(writer.events[3].numbers["assigned"], 1.0);
    EXPECT_DOUBLE_EQ(writer.events[3].numbers["unassigned"], 1.0);

    for (std::size_t i = 0; i < writer.events.size(); ++i) {
        EXPECT_EQ(writer.events[i].step, i);
    }

    // Steps restart on every run
    writer.events.clear();
    (void)allocator_.allocate(team);
    ASSERT_FALSE(writer.events.empty());
    EXPECT_EQ(writer.events[0].step, 0U);
}

TEST_F(GreedyAllocatorTest, NonFiniteScoreRaisesAllocationError) {
    Team team;
    team.add_member(Member("1", "Alice", {{"React", 1e308}}, 40.0));
    team.add_task(make_task("1", {"React"}, 8.0));

    EXPECT_THROW((void)allocator_.allocate(team), AllocationError);

    try {
        (void)allocator_.allocate(team);
        FAIL() << "expected AllocationError";
    }
    catch (const AllocationError& e) {
        EXPECT_EQ(e.task_id(), "1");
        EXPECT_EQ(e.member_id(), "1");
    }

    // The failed run left the input untouched
    EXPECT_DOUBLE_EQ(team.member(0).current_workload(), 0.0);
    EXPECT_FALSE(team.task(0).is_assigned());
}
