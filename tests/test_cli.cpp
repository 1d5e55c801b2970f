/**
 * @file test_cli.cpp
 * @brief Unit tests for the command handlers (GoogleTest)
 *
 * Tests cover the handlers behind each subcommand:
 * - projects: grouped listing
 * - import: strategies and the imported summary
 * - metrics: definition listing
 * - tasks: glob filtering and detailed totals
 * - record: multi-value recording with all-or-nothing semantics
 *
 * Note: These tests verify the functions used by the CLI, not the
 * binary itself.
 */

#include <gtest/gtest.h>

#include "maxify/Commands.hpp"
#include "maxify/Errors.hpp"
#include "TestHelpers.hpp"

#include <sstream>

using namespace maxify;
using maxify::test::TempFile;
using maxify::test::org_project;
using maxify::test::sample_project;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

class CommandTest : public ::testing::Test {
protected:
    ProjectStore store{":memory:"};
    std::ostringstream out;

    void seed() {
        Project project = sample_project();
        Project org = org_project();
        store.save(project);
        store.save(org);
    }
};

} // anonymous namespace

// ============================================================================
// projects
// ============================================================================

TEST_F(CommandTest, ProjectsEmpty) {
    EXPECT_EQ(cmd_projects(store, out), 0);
    EXPECT_EQ(out.str(), "\nNo projects found\n\n");
}

TEST_F(CommandTest, ProjectsGroupedByOrganization) {
    seed();
    EXPECT_EQ(cmd_projects(store, out), 0);
    EXPECT_EQ(out.str(),
              "\ndefault\n-------\n\n"
              " * test - Test project\n"
              "\norg1\n----\n\n"
              " * org1/org1_project - Project in an organization\n"
              "\n");
}

TEST_F(CommandTest, ProjectsWithoutDescription) {
    Project bare("bare");
    store.save(bare);
    cmd_projects(store, out);
    EXPECT_TRUE(contains(out.str(), " * bare - No description provided\n"));
}

// ============================================================================
// import
// ============================================================================

TEST_F(CommandTest, ImportListsProjects) {
    TempFile file(R"({"projects": [{"name": "test", "desc": "Imported"}]})");
    EXPECT_EQ(cmd_import(store, file.path(), ImportStrategy::Abort, out), 0);
    EXPECT_TRUE(contains(out.str(), "The following projects were imported:"));
    EXPECT_TRUE(contains(out.str(), " * test - Imported"));
    EXPECT_TRUE(store.contains("test"));
}

TEST_F(CommandTest, ImportConflictPropagates) {
    seed();
    TempFile file(R"({"projects": [{"name": "test"}]})");
    EXPECT_THROW(cmd_import(store, file.path(), ImportStrategy::Abort, out), ProjectConflictError);
}

TEST_F(CommandTest, ImportMergePrintsWarnings) {
    seed();
    TempFile file(R"({"projects": [{"name": "test", "metrics": [
        {"name": "Compile Time", "metric_type": "Integer"}]}]})");
    EXPECT_EQ(cmd_import(store, file.path(), ImportStrategy::Merge, out), 0);
    EXPECT_TRUE(contains(out.str(), "Warning: Metric 'Compile Time'"));
    EXPECT_TRUE(contains(out.str(), " * test - "));
}

// ============================================================================
// metrics
// ============================================================================

TEST_F(CommandTest, MetricsListing) {
    seed();
    EXPECT_EQ(cmd_metrics(store, "test", out), 0);
    const std::string text = out.str();

    EXPECT_TRUE(contains(text, "\ntest Metrics:\n"));
    EXPECT_TRUE(contains(text, " * Compile Time (Duration)\n"));
    EXPECT_TRUE(contains(text, " * Story Points (Integer)\n"));
    EXPECT_TRUE(contains(text, "   - Description: Estimated effort\n"));
    EXPECT_TRUE(contains(text, "   - Possible Values: 1, 2, 3, 5, 8\n"));
    EXPECT_TRUE(contains(text, "   - Default Value: 3\n"));
    // sorted by name
    EXPECT_LT(text.find("Compile Time"), text.find("Story Points"));
}

TEST_F(CommandTest, MetricsUnknownProject) {
    EXPECT_THROW(cmd_metrics(store, "missing", out), ModelError);
}

// ============================================================================
// tasks
// ============================================================================

TEST_F(CommandTest, TasksFilteredAndSorted) {
    Project project = sample_project();
    project.record("Task 10", "Story Points", "1");
    project.record("Task 2", "Story Points", "2");
    project.record("Bug 1", "Story Points", "3");
    store.save(project);

    EXPECT_EQ(cmd_tasks(store, "test", "task*", false, out), 0);
    const std::string text = out.str();
    EXPECT_TRUE(contains(text, " * Task 2\n"));
    EXPECT_TRUE(contains(text, " * Task 10\n"));
    EXPECT_FALSE(contains(text, "Bug 1"));
    EXPECT_LT(text.find("Task 2"), text.find("Task 10"));
}

TEST_F(CommandTest, TasksDetails) {
    Project project = sample_project();
    project.record("Task 1", "Story Points", "5");
    project.record("Task 1", "Compile Time", "2 hrs");
    project.record("Task 1", "Compile Time", "5 mins");
    store.save(project);

    EXPECT_EQ(cmd_tasks(store, "test", "*", true, out), 0);
    const std::string text = out.str();
    EXPECT_TRUE(contains(text, " * Task 1\n"));
    EXPECT_TRUE(contains(text, "    Story Points | 5\n"));
    EXPECT_TRUE(contains(text, "    Compile Time | 2:05:00\n"));
    EXPECT_TRUE(contains(text, "    Created      | "));
    EXPECT_TRUE(contains(text, "    Last Updated | "));
}

TEST_F(CommandTest, TasksDetailsWithoutData) {
    Project project = sample_project();
    project.record("Task 1", "Story Points", "5");
    store.save(project);

    cmd_tasks(store, "test", "", true, out);
    EXPECT_TRUE(contains(out.str(), "    Compile Time | ----\n"));
}

// ============================================================================
// record
// ============================================================================

TEST_F(CommandTest, RecordSeveralValues) {
    seed();
    EXPECT_EQ(cmd_record(store, "test", "Task 1",
                         {{"story_points", "5"}, {"Compile Time", "10:05"}}, out), 0);
    EXPECT_EQ(out.str(), " Story Points -> 5\n Compile Time -> 10:05:00\nTask updated\n");

    auto loaded = store.get("test");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->find_task("Task 1")->total(*loaded->metric("Story Points")),
              std::optional<Value>(std::int64_t(5)));
}

TEST_F(CommandTest, RecordAccumulatesAcrossCalls) {
    seed();
    cmd_record(store, "org1/org1_project", "Task 1", {{"Coverage", "0.25"}}, out);
    out.str("");
    cmd_record(store, "ORG1/org1_project", "Task 1", {{"Coverage", "0.5"}}, out);
    EXPECT_EQ(out.str(), " Coverage -> 0.75\nTask updated\n");
}

TEST_F(CommandTest, RecordIsAllOrNothing) {
    seed();
    EXPECT_THROW(cmd_record(store, "test", "Task 1",
                            {{"Story Points", "5"}, {"Story Points", "13"}}, out),
                 ValueNotAllowedError);
    EXPECT_THROW(cmd_record(store, "test", "Task 1",
                            {{"Story Points", "5"}, {"Velocity", "1"}}, out),
                 ModelError);
    EXPECT_THROW(cmd_record(store, "test", "Task 1",
                            {{"Compile Time", "later"}}, out),
                 ParsingError);

    EXPECT_TRUE(store.get("test")->tasks().empty());
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CommandTest, RecordRequiresValuesAndProject) {
    seed();
    EXPECT_THROW(cmd_record(store, "test", "Task 1", {}, out), ModelError);
    EXPECT_THROW(cmd_record(store, "missing", "Task 1", {{"a", "1"}}, out), ModelError);
}
