/**
 * @file Commands.cpp
 * @brief Implementation of the command handlers
 */

#include "maxify/Commands.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Units.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <ctime>
#include <map>

namespace maxify {

namespace {

    void print_title(std::ostream& out, const std::string& line) {
        out << "\n" << line << "\n"
            << std::string(std::min<size_t>(line.size(), 80), '-') << "\n\n";
    }

    void print_project_summary(std::ostream& out, const Project& project) {
        out << " * " << project.qualified_name() << " - "
            << project.description().value_or("No description provided") << "\n";
    }

    std::string format_time(TimePoint tp) {
        const std::time_t t = Clock::to_time_t(tp);
        return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(t));
    }

    Project require_project(const ProjectStore& store, const std::string& name) {
        auto project = store.get(name);
        if (!project) {
            throw ModelError("Unknown project '" + name + "'");
        }
        return std::move(*project);
    }
}

// ============================================================================
// projects
// ============================================================================

int cmd_projects(const ProjectStore& store, std::ostream& out) {
    const auto projects = store.all();
    if (projects.empty()) {
        out << "\nNo projects found\n\n";
        return 0;
    }

    std::map<std::string, std::vector<const Project*>> by_org;
    for (const auto& project : projects) {
        by_org[project.organization().value_or("")].push_back(&project);
    }

    for (const auto& [org, members] : by_org) {
        print_title(out, org.empty() ? "default" : org);
        for (const Project* project : members) {
            print_project_summary(out, *project);
        }
    }
    out << "\n";
    return 0;
}

// ============================================================================
// import
// ============================================================================

int cmd_import(ProjectStore& store, const std::string& path,
               ImportStrategy strategy, std::ostream& out) {
    const ImportResult result = import_config(store, path, strategy);

    for (const auto& warning : result.warnings) {
        out << "Warning: " << warning.message << "\n";
    }

    if (result.projects.empty()) {
        out << "\nNo projects were imported\n\n";
        return 0;
    }

    out << "\nThe following projects were imported:\n";
    for (const auto& project : result.projects) {
        print_project_summary(out, project);
    }
    out << "\n";
    return 0;
}

// ============================================================================
// metrics
// ============================================================================

int cmd_metrics(const ProjectStore& store, const std::string& name, std::ostream& out) {
    const Project project = require_project(store, name);

    std::vector<const Metric*> metrics;
    for (const auto& m : project.metrics()) {
        metrics.push_back(&m);
    }
    std::sort(metrics.begin(), metrics.end(), [](const Metric* a, const Metric* b) {
        return a->name() < b->name();
    });

    print_title(out, project.name() + " Metrics:");
    for (const Metric* metric : metrics) {
        out << " * " << metric->name() << " (" << value_kind_name(metric->kind()) << ")\n";

        if (metric->description()) {
            out << "   - Description: " << *metric->description() << "\n";
        }

        if (metric->allowed_values() && !metric->allowed_values()->empty()) {
            std::vector<std::string> values;
            for (const auto& v : *metric->allowed_values()) {
                values.push_back(format_value(v));
            }
            out << "   - Possible Values: " << fmt::format("{}", fmt::join(values, ", ")) << "\n";
        }

        if (metric->default_value()) {
            out << "   - Default Value: " << format_value(*metric->default_value()) << "\n";
        }
    }
    out << "\n";
    return 0;
}

// ============================================================================
// tasks
// ============================================================================

int cmd_tasks(const ProjectStore& store, const std::string& name,
              const std::string& pattern, bool details, std::ostream& out) {
    const Project project = require_project(store, name);

    // align detail values on the longest label
    size_t width = std::string("Last Updated").size();
    for (const auto& m : project.metrics()) {
        width = std::max(width, m.name().size());
    }

    print_title(out, "Tasks");
    for (const Task* task : project.tasks_matching(pattern == "*" ? std::string() : pattern)) {
        out << " * " << task->name() << "\n";
        if (!details) {
            continue;
        }

        out << " " << std::string(51, '-') << "\n";
        for (const auto& metric : project.metrics()) {
            auto value = task->has_data(metric.name()) ? task->total(metric) : std::nullopt;
            out << fmt::format("    {:<{}} | {}\n", metric.name(), width,
                               value ? format_value(*value) : "----");
        }
        out << "\n";
        out << fmt::format("    {:<{}} | {}\n", "Created", width, format_time(task->created_at()));
        out << fmt::format("    {:<{}} | {}\n", "Last Updated", width, format_time(task->last_updated_at()));
        out << "\n";
    }
    out << "\n";
    return 0;
}

// ============================================================================
// record
// ============================================================================

int cmd_record(ProjectStore& store, const std::string& name, const std::string& task,
               const std::vector<std::pair<std::string, std::string>>& values,
               std::ostream& out) {
    if (values.empty()) {
        throw ModelError("Nothing to record for task '" + task + "'");
    }

    // Work on a loaded copy; the store only changes once every value is in.
    Project project = require_project(store, name);
    for (const auto& [metric, text] : values) {
        project.record(task, metric, text);
    }
    store.save(project);

    const Task* updated = project.find_task(task);
    for (const auto& [metric, text] : values) {
        const Metric* m = project.metric(metric);
        auto total = updated->total(*m);
        out << " " << m->name() << " -> " << (total ? format_value(*total) : "----") << "\n";
    }
    out << "Task updated\n";
    return 0;
}

} // namespace maxify
