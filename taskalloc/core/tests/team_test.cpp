#include <taskalloc/core/team.hpp>
#include <taskalloc/core/error.hpp>

#include <gtest/gtest.h>

using namespace taskalloc::core;

class TeamTest : public ::testing::Test {
protected:
    void SetUp() override {
        team_.add_member(Member("1", "Alice", {{"React", 8}}, 40.0));
        team_.add_member(Member("2", "Bob", {{"Python", 9}}, 30.0));
        team_.add_task(Task("t1", "UI", "", {"React"}, 8.0, Priority::High,
                            make_date(2025, 1, 15)));
        team_.add_task(Task("t2", "API", "", {"Python"}, 6.0, Priority::Medium,
                            make_date(2025, 2, 1)));
    }

    Team team_;
};

TEST_F(TeamTest, PreservesInputOrder) {
    ASSERT_EQ(team_.member_count(), 2U);
    ASSERT_EQ(team_.task_count(), 2U);
    EXPECT_EQ(team_.member(0).id(), "1");
    EXPECT_EQ(team_.member(1).id(), "2");
    EXPECT_EQ(team_.task(0).id(), "t1");
    EXPECT_EQ(team_.task(1).id(), "t2");
}

TEST_F(TeamTest, RejectsDuplicateIds) {
    EXPECT_THROW(team_.add_member(Member("1", "Other", {}, 10.0)), DuplicateIdError);
    EXPECT_THROW(team_.add_task(Task("t1", "Other", "", {}, 1.0, Priority::Low,
                                     make_date(2025, 1, 1))),
                 DuplicateIdError);
    EXPECT_EQ(team_.member_count(), 2U);
    EXPECT_EQ(team_.task_count(), 2U);
}

TEST_F(TeamTest, FindById) {
    ASSERT_NE(team_.find_member("2"), nullptr);
    EXPECT_EQ(team_.find_member("2")->name(), "Bob");
    EXPECT_EQ(team_.find_member("3"), nullptr);

    ASSERT_NE(team_.find_task("t2"), nullptr);
    EXPECT_EQ(team_.find_task("t2")->title(), "API");
    EXPECT_EQ(team_.find_task("t9"), nullptr);
}

TEST_F(TeamTest, RemoveMemberUnassignsTheirTasks) {
    team_.find_task("t1")->assign_to("1");
    team_.find_task("t2")->assign_to("2");

    team_.remove_member("1");

    EXPECT_EQ(team_.member_count(), 1U);
    EXPECT_FALSE(team_.find_task("t1")->is_assigned());
    EXPECT_TRUE(team_.find_task("t2")->is_assigned());
}

TEST_F(TeamTest, RemoveUnknownThrows) {
    EXPECT_THROW(team_.remove_member("42"), NotFoundError);
    EXPECT_THROW(team_.remove_task("t42"), NotFoundError);
}

TEST_F(TeamTest, RemoveTask) {
    team_.remove_task("t1");

    ASSERT_EQ(team_.task_count(), 1U);
    EXPECT_EQ(team_.task(0).id(), "t2");
}

TEST_F(TeamTest, ResetWorkloadsClearsState) {
    team_.find_member("1")->commit(8.0);
    team_.find_member("2")->commit(6.0);
    team_.find_task("t1")->assign_to("1");
    team_.find_task("t2")->assign_to("2");

    reset_workloads(team_);

    for (const auto& member : team_.members()) {
        EXPECT_DOUBLE_EQ(member.current_workload(), 0.0);
    }
    for (const auto& task : team_.tasks()) {
        EXPECT_FALSE(task.is_assigned());
    }
}

TEST_F(TeamTest, CopiesAreIndependentSnapshots) {
    Team copy = team_;
    copy.find_member("1")->commit(10.0);
    copy.find_task("t1")->assign_to("1");

    EXPECT_DOUBLE_EQ(team_.find_member("1")->current_workload(), 0.0);
    EXPECT_FALSE(team_.find_task("t1")->is_assigned());
}
