/**
 * @file test_model.cpp
 * @brief Tests for metrics, tasks and projects
 */

#include <gtest/gtest.h>
#include "maxify/Errors.hpp"
#include "maxify/Project.hpp"
#include "TestHelpers.hpp"

#include <limits>

using namespace maxify;
using maxify::test::sample_project;
using maxify::test::org_project;
using maxify::test::seconds;

// ============================================================================
// Metric
// ============================================================================

TEST(Metric, DerivesAggregation) {
    EXPECT_TRUE(Metric("t", ValueKind::Duration).is_cumulative());
    EXPECT_FALSE(Metric("n", ValueKind::Integer).is_cumulative());
    EXPECT_EQ(Metric("s", ValueKind::String).aggregation(), AggregationPolicy::ScalarOverwrite);
}

TEST(Metric, RejectsInvalidDefinitions) {
    EXPECT_THROW(Metric("", ValueKind::Integer), ConfigError);
    EXPECT_THROW(Metric("m", ValueKind::Integer, std::nullopt,
                        std::vector<Value>{std::string("x")}),
                 ConfigError);
    EXPECT_THROW(Metric("m", ValueKind::Integer, std::nullopt, std::nullopt,
                        Value(Decimal(1))),
                 ConfigError);
    EXPECT_THROW(Metric("m", ValueKind::Integer, std::nullopt,
                        std::vector<Value>{std::int64_t(1), std::int64_t(2)},
                        Value(std::int64_t(4))),
                 ConfigError);
}

TEST(Metric, ParseUsesKind) {
    Metric m("Compile Time", ValueKind::Duration);
    EXPECT_EQ(m.parse("2 hrs"), Value(seconds(7200)));
    EXPECT_THROW(m.parse("two hours"), ParsingError);
}

TEST(Metric, ValidateAllowedValues) {
    Project project = sample_project();
    const Metric* points = project.find_metric("Story Points");
    ASSERT_NE(points, nullptr);

    EXPECT_NO_THROW(points->validate(std::int64_t(5)));
    EXPECT_THROW(points->validate(std::int64_t(13)), ValueNotAllowedError);
    EXPECT_THROW(points->validate(std::string("5")), ModelError);
}

TEST(Metric, RefreshFromSameKindOnly) {
    Metric m("Coverage", ValueKind::Decimal, "old");
    m.refresh_from(Metric("Coverage", ValueKind::Decimal, "new"));
    EXPECT_EQ(m.description(), std::optional<std::string>("new"));
    EXPECT_THROW(m.refresh_from(Metric("Coverage", ValueKind::Integer)), ModelError);
}

// ============================================================================
// Task
// ============================================================================

TEST(Task, EmptyNameRejected) {
    EXPECT_THROW(Task(""), ModelError);
}

TEST(Task, IntegerAccumulates) {
    Metric m("Lines", ValueKind::Integer);
    Task task("Task 1");
    task.record(m, std::int64_t(5));
    task.record(m, std::int64_t(10));

    EXPECT_EQ(task.total(m), std::optional<Value>(std::int64_t(15)));
    EXPECT_EQ(task.data_points().size(), 1u);
    EXPECT_TRUE(task.entries("Lines").empty());
}

TEST(Task, DecimalAccumulatesExactly) {
    Metric m("Coverage", ValueKind::Decimal);
    Task task("Task 1");
    task.record(m, Decimal::parse("0.1"));
    task.record(m, Decimal::parse("0.2"));
    EXPECT_EQ(task.total(m), std::optional<Value>(Decimal::parse("0.3")));
}

TEST(Task, StringOverwrites) {
    Metric m("Notes", ValueKind::String);
    Task task("Task 1");
    task.record(m, std::string("first"));
    task.record(m, std::string("second"));
    EXPECT_EQ(task.total(m), std::optional<Value>(std::string("second")));
    EXPECT_EQ(task.data_points().size(), 1u);
}

TEST(Task, DurationAppendsHistogramEntries) {
    Metric m("Compile Time", ValueKind::Duration);
    Task task("Task 1");
    task.record(m, seconds(525));
    task.record(m, seconds(75));

    auto entries = task.entries("Compile Time");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].value, Value(seconds(525)));
    EXPECT_EQ(entries[1].value, Value(seconds(75)));
    EXPECT_FALSE(entries[0].entry_id.empty());
    EXPECT_NE(entries[0].entry_id, entries[1].entry_id);
    EXPECT_EQ(task.total(m), std::optional<Value>(seconds(600)));
    EXPECT_EQ(task.data_point("Compile Time"), nullptr);
}

TEST(Task, HistogramWithoutEntriesTotalsZero) {
    Metric m("Compile Time", ValueKind::Duration);
    Task task("Task 1");
    EXPECT_EQ(task.total(m), std::optional<Value>(Duration()));
}

TEST(Task, ScalarWithoutDataHasNoTotal) {
    Metric m("Lines", ValueKind::Integer, std::nullopt, std::nullopt, Value(std::int64_t(7)));
    Task task("Task 1");
    EXPECT_FALSE(task.total(m).has_value());
    EXPECT_EQ(task.value_or_default(m), std::optional<Value>(std::int64_t(7)));

    task.record(m, std::int64_t(1));
    EXPECT_EQ(task.value_or_default(m), std::optional<Value>(std::int64_t(1)));
}

TEST(Task, RejectedValueLeavesTaskUnchanged) {
    Project project = sample_project();
    const Metric& points = *project.find_metric("Story Points");
    Task task("Task 1");
    task.record(points, std::int64_t(5));
    const TimePoint updated = task.last_updated_at();

    EXPECT_THROW(task.record(points, std::int64_t(13)), ValueNotAllowedError);
    EXPECT_EQ(task.total(points), std::optional<Value>(std::int64_t(5)));
    EXPECT_EQ(task.last_updated_at(), updated);
}

TEST(Task, OverflowLeavesValueUnchanged) {
    Metric m("Lines", ValueKind::Integer);
    Task task("Task 1");
    task.record(m, std::numeric_limits<std::int64_t>::max());
    EXPECT_THROW(task.record(m, std::int64_t(1)), ModelError);
    EXPECT_EQ(task.total(m), std::optional<Value>(std::numeric_limits<std::int64_t>::max()));
}

TEST(Task, RecordBumpsLastUpdated) {
    Metric m("Lines", ValueKind::Integer);
    Task task("Task 1");
    const TimePoint created = task.created_at();
    task.record(m, std::int64_t(1));
    EXPECT_GE(task.last_updated_at(), created);
    EXPECT_EQ(task.created_at(), created);
}

TEST(Task, RestoredTimestampsAreOrdered) {
    const TimePoint t0 = Clock::now();
    Task task("Task 1", std::nullopt, t0, t0 - std::chrono::seconds(5));
    EXPECT_EQ(task.created_at(), t0);
    EXPECT_EQ(task.last_updated_at(), t0);
}

TEST(Task, RemoveMetricData) {
    Metric time("Compile Time", ValueKind::Duration);
    Metric lines("Lines", ValueKind::Integer);
    Task task("Task 1");
    task.record(time, seconds(1));
    task.record(time, seconds(2));
    task.record(lines, std::int64_t(3));

    EXPECT_EQ(task.remove_metric_data("Compile Time"), 2u);
    EXPECT_FALSE(task.has_data("Compile Time"));
    EXPECT_TRUE(task.has_data("Lines"));
}

// ============================================================================
// Project
// ============================================================================

TEST(Project, QualifiedName) {
    EXPECT_EQ(sample_project().qualified_name(), "test");
    EXPECT_EQ(org_project().qualified_name(), "org1/org1_project");
}

TEST(Project, SplitQualifiedName) {
    auto [org, name] = Project::split_qualified_name("org1/project");
    EXPECT_EQ(org, std::optional<std::string>("org1"));
    EXPECT_EQ(name, "project");

    auto [no_org, bare] = Project::split_qualified_name("project");
    EXPECT_FALSE(no_org.has_value());
    EXPECT_EQ(bare, "project");
}

TEST(Project, IdentityValidation) {
    EXPECT_THROW(Project(""), ConfigError);
    EXPECT_THROW(Project("a/b"), ConfigError);
    EXPECT_THROW(Project("p", std::string("o/x")), ConfigError);
    EXPECT_FALSE(Project("p", std::string("")).organization().has_value());
}

TEST(Project, NormalizeIdentityLowercases) {
    Project project("My Project", std::string("Org1"));
    project.normalize_identity();
    EXPECT_EQ(project.qualified_name(), "org1/my project");
}

TEST(Project, DuplicateMetricRejected) {
    Project project = sample_project();
    EXPECT_THROW(project.add_metric(Metric("Story Points", ValueKind::Integer)), ConfigError);
    EXPECT_EQ(project.metrics().size(), 2u);
    EXPECT_EQ(project.metrics()[0].name(), "Story Points");
    EXPECT_EQ(project.metrics()[1].name(), "Compile Time");
}

TEST(Project, MetricLookup) {
    Project project = sample_project();
    ASSERT_NE(project.metric("Compile Time"), nullptr);
    ASSERT_NE(project.metric("compile_time"), nullptr);
    EXPECT_EQ(project.metric("compile_time")->name(), "Compile Time");
    EXPECT_EQ(project.metric("STORY POINTS")->name(), "Story Points");
    EXPECT_EQ(project.metric("Velocity"), nullptr);
    EXPECT_EQ(project.find_metric("compile_time"), nullptr);
}

TEST(Project, RemoveMetricCascades) {
    Project project = sample_project();
    project.record("Task 1", "Compile Time", "5 mins");
    project.record("Task 1", "Story Points", "3");

    EXPECT_TRUE(project.remove_metric("Compile Time"));
    EXPECT_EQ(project.metric("Compile Time"), nullptr);
    EXPECT_FALSE(project.find_task("Task 1")->has_data("Compile Time"));
    EXPECT_TRUE(project.find_task("Task 1")->has_data("Story Points"));
    EXPECT_FALSE(project.remove_metric("Compile Time"));
}

TEST(Project, TaskCreatedOnDemand) {
    Project project = sample_project();
    EXPECT_EQ(project.find_task("Task 1"), nullptr);
    Task& task = project.task("Task 1");
    EXPECT_EQ(task.name(), "Task 1");
    EXPECT_EQ(&project.task("Task 1"), &task);
    EXPECT_EQ(project.tasks().size(), 1u);
}

TEST(Project, AddTaskRejectsDuplicate) {
    Project project = sample_project();
    project.add_task(Task("Task 1", std::string("first")));
    EXPECT_THROW(project.add_task(Task("Task 1")), ModelError);
    EXPECT_EQ(project.find_task("Task 1")->description(), std::optional<std::string>("first"));
}

TEST(Project, TasksMatchingNaturalOrder) {
    Project project = sample_project();
    for (const char* name : {"Task 10", "Task 2", "Task 1", "Bug 1"}) {
        project.task(name);
    }

    auto matched = project.tasks_matching("task*");
    ASSERT_EQ(matched.size(), 3u);
    EXPECT_EQ(matched[0]->name(), "Task 1");
    EXPECT_EQ(matched[1]->name(), "Task 2");
    EXPECT_EQ(matched[2]->name(), "Task 10");

    EXPECT_EQ(project.tasks_matching("").size(), 4u);
    EXPECT_TRUE(project.tasks_matching("Feature*").empty());
}

TEST(Project, TasksStartingWith) {
    Project project = sample_project();
    for (const char* name : {"Task 10", "Task 2", "Bug 1"}) {
        project.task(name);
    }
    EXPECT_EQ(project.tasks_starting_with("ta"),
              (std::vector<std::string>{"Task 2", "Task 10"}));
}

TEST(Project, RecordParsesAndAccumulates) {
    Project project = sample_project();
    project.record("Task 1", "Story Points", "5");
    project.record("Task 1", "compile_time", "2 hrs, 5 mins");
    project.record("Task 1", "Compile Time", "525s");

    const Task* task = project.find_task("Task 1");
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->total(*project.metric("Story Points")),
              std::optional<Value>(std::int64_t(5)));
    EXPECT_EQ(task->total(*project.metric("Compile Time")),
              std::optional<Value>(seconds(8025)));
}

TEST(Project, RecordIsAllOrNothing) {
    Project project = sample_project();

    EXPECT_THROW(project.record("Task 1", "Velocity", "1"), ModelError);
    EXPECT_THROW(project.record("Task 1", "Story Points", "13"), ValueNotAllowedError);
    EXPECT_THROW(project.record("Task 1", "Compile Time", "soon"), ParsingError);
    EXPECT_EQ(project.find_task("Task 1"), nullptr);

    project.record("Task 1", "Story Points", "5");
    EXPECT_THROW(project.record("Task 1", "Story Points", "13"), ValueNotAllowedError);
    EXPECT_EQ(project.find_task("Task 1")->total(*project.metric("Story Points")),
              std::optional<Value>(std::int64_t(5)));
}
