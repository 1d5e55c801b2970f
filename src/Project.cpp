/**
 * @file Project.cpp
 * @brief Implementation of the project aggregate
 */

#include "maxify/Project.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Util.hpp"

#include <algorithm>

namespace maxify {

namespace {

    std::string normalize_metric_name(const std::string& name) {
        std::string out = to_lower(name);
        std::replace(out.begin(), out.end(), '_', ' ');
        return out;
    }

    void check_identity_part(const std::string& what, const std::string& value) {
        if (value.find(Project::separator) != std::string::npos) {
            throw ConfigError("Project " + what + " '" + value + "' must not contain '"
                              + std::string(1, Project::separator) + "'");
        }
    }
}

// ============================================================================
// Identity
// ============================================================================

Project::Project(std::string name,
                 std::optional<std::string> organization,
                 std::optional<std::string> description)
    : name_(std::move(name))
    , organization_(std::move(organization))
    , description_(std::move(description))
{
    if (name_.empty()) {
        throw ConfigError("Project name must not be empty");
    }
    if (organization_ && organization_->empty()) {
        organization_.reset();
    }
    check_identity_part("name", name_);
    if (organization_) {
        check_identity_part("organization", *organization_);
    }
}

std::string Project::qualified_name() const {
    if (organization_) {
        return *organization_ + separator + name_;
    }
    return name_;
}

std::pair<std::optional<std::string>, std::string>
Project::split_qualified_name(const std::string& qualified) {
    auto pos = qualified.find(separator);
    if (pos == std::string::npos) {
        return {std::nullopt, qualified};
    }
    return {qualified.substr(0, pos), qualified.substr(pos + 1)};
}

void Project::normalize_identity() {
    name_ = to_lower(name_);
    if (organization_) {
        organization_ = to_lower(*organization_);
    }
}

// ============================================================================
// Metrics
// ============================================================================

Metric& Project::add_metric(Metric metric) {
    if (find_metric(metric.name())) {
        throw ConfigError("Metric '" + metric.name() + "' already exists in project '"
                          + qualified_name() + "'");
    }
    metrics_.push_back(std::move(metric));
    return metrics_.back();
}

const Metric* Project::find_metric(const std::string& name) const {
    for (const auto& m : metrics_) {
        if (m.name() == name) {
            return &m;
        }
    }
    return nullptr;
}

Metric* Project::find_metric(const std::string& name) {
    return const_cast<Metric*>(static_cast<const Project*>(this)->find_metric(name));
}

const Metric* Project::metric(const std::string& lookup) const {
    if (const Metric* exact = find_metric(lookup)) {
        return exact;
    }
    const std::string wanted = normalize_metric_name(lookup);
    for (const auto& m : metrics_) {
        if (normalize_metric_name(m.name()) == wanted) {
            return &m;
        }
    }
    return nullptr;
}

Metric* Project::metric(const std::string& lookup) {
    return const_cast<Metric*>(static_cast<const Project*>(this)->metric(lookup));
}

bool Project::remove_metric(const std::string& name) {
    auto it = std::find_if(metrics_.begin(), metrics_.end(), [&](const Metric& m) {
        return m.name() == name;
    });
    if (it == metrics_.end()) {
        return false;
    }
    for (auto& [task_name, task] : tasks_) {
        task.remove_metric_data(name);
    }
    metrics_.erase(it);
    return true;
}

// ============================================================================
// Tasks
// ============================================================================

Task& Project::task(const std::string& name) {
    auto it = tasks_.find(name);
    if (it != tasks_.end()) {
        return it->second;
    }
    return tasks_.emplace(name, Task(name)).first->second;
}

const Task* Project::find_task(const std::string& name) const {
    auto it = tasks_.find(name);
    return it == tasks_.end() ? nullptr : &it->second;
}

Task* Project::find_task(const std::string& name) {
    auto it = tasks_.find(name);
    return it == tasks_.end() ? nullptr : &it->second;
}

Task& Project::add_task(Task task) {
    const std::string name = task.name();
    auto [it, inserted] = tasks_.emplace(name, std::move(task));
    if (!inserted) {
        throw ModelError("Task '" + name + "' already exists in project '"
                         + qualified_name() + "'");
    }
    return it->second;
}

std::vector<const Task*> Project::tasks_matching(const std::string& pattern) const {
    std::vector<const Task*> out;
    for (const auto& [name, task] : tasks_) {
        if (glob_match(pattern, name)) {
            out.push_back(&task);
        }
    }
    std::sort(out.begin(), out.end(), [](const Task* a, const Task* b) {
        return natural_less(a->name(), b->name());
    });
    return out;
}

std::vector<std::string> Project::tasks_starting_with(const std::string& prefix) const {
    const std::string lower = to_lower(prefix);
    std::vector<std::string> out;
    for (const auto& [name, task] : tasks_) {
        if (starts_with(to_lower(name), lower)) {
            out.push_back(name);
        }
    }
    std::sort(out.begin(), out.end(), natural_less);
    return out;
}

Task& Project::record(const std::string& task_name,
                      const std::string& metric_lookup,
                      const std::string& text) {
    const Metric* m = metric(metric_lookup);
    if (!m) {
        throw ModelError("Unknown metric '" + metric_lookup + "' for project '"
                         + qualified_name() + "'");
    }
    const Value value = m->parse(text);

    if (Task* existing = find_task(task_name)) {
        existing->record(*m, value);
        return *existing;
    }

    Task fresh(task_name);
    fresh.record(*m, value);
    return tasks_.emplace(task_name, std::move(fresh)).first->second;
}

} // namespace maxify
