/**
 * @file Project.hpp
 * @brief Project aggregate: metric schema plus tasks
 */

#ifndef MAXIFY_PROJECT_HPP
#define MAXIFY_PROJECT_HPP

#include "maxify/Metric.hpp"
#include "maxify/Task.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace maxify {

/**
 * @brief A named metric schema and the tasks recorded against it
 *
 * Metrics keep insertion order and are unique by exact name. Tasks are
 * unique by name. Deleting a metric drops its data points from every task.
 *
 * Pointers and references returned by metric lookups are invalidated by
 * add_metric() and remove_metric().
 */
class Project {
public:
    /// Separator between organization and name in a qualified name
    static constexpr char separator = '/';

    /**
     * @throws ConfigError if name is empty or name/organization contains
     *         the separator
     */
    explicit Project(std::string name,
                     std::optional<std::string> organization = std::nullopt,
                     std::optional<std::string> description = std::nullopt);

    const std::string& name() const noexcept { return name_; }
    const std::optional<std::string>& organization() const noexcept { return organization_; }
    const std::optional<std::string>& description() const noexcept { return description_; }
    void set_description(std::optional<std::string> description) {
        description_ = std::move(description);
    }

    /**
     * @brief "organization/name", or "name" without an organization
     */
    std::string qualified_name() const;

    /**
     * @brief Split on the first separator into (organization, name)
     *
     * ```cpp
     * split_qualified_name("org1/project") // → {"org1", "project"}
     * split_qualified_name("project")      // → {nullopt, "project"}
     * ```
     */
    static std::pair<std::optional<std::string>, std::string>
    split_qualified_name(const std::string& qualified);

    /**
     * @brief Lower-case name and organization (store identity form)
     */
    void normalize_identity();

    /// Store row id, empty until persisted
    std::optional<std::int64_t> id() const noexcept { return id_; }
    void set_id(std::optional<std::int64_t> id) noexcept { id_ = id; }

    // ---- Metrics ----

    /**
     * @brief Add a metric definition
     * @throws ConfigError if a metric with the exact same name exists;
     *         the project is unchanged in that case
     */
    Metric& add_metric(Metric metric);

    const std::vector<Metric>& metrics() const noexcept { return metrics_; }

    /**
     * @brief Resolve a metric by exact name, then by normalized name
     *        (lowercase, '_' read as ' '), so "compile_time" finds
     *        "Compile Time"
     * @return nullptr if neither matches
     */
    const Metric* metric(const std::string& lookup) const;
    Metric* metric(const std::string& lookup);

    /// Exact-name lookup only
    const Metric* find_metric(const std::string& name) const;
    Metric* find_metric(const std::string& name);

    /**
     * @brief Remove a metric and all data points recorded against it
     * @return false if no metric has that exact name
     */
    bool remove_metric(const std::string& name);

    // ---- Tasks ----

    /**
     * @brief Get a task, creating it on first use
     */
    Task& task(const std::string& name);

    const Task* find_task(const std::string& name) const;
    Task* find_task(const std::string& name);

    /**
     * @brief Insert a fully formed task
     * @throws ModelError if a task of that name exists
     */
    Task& add_task(Task task);

    const std::map<std::string, Task>& tasks() const noexcept { return tasks_; }

    /**
     * @brief Tasks whose names match a case-insensitive glob, in natural
     *        order. An empty pattern matches every task.
     */
    std::vector<const Task*> tasks_matching(const std::string& pattern) const;

    /**
     * @brief Task names starting with a case-insensitive prefix
     */
    std::vector<std::string> tasks_starting_with(const std::string& prefix) const;

    /**
     * @brief Parse text for a metric and record it on a task
     *
     * The task is created if needed. Nothing changes if the metric is
     * unknown, the text does not parse or validation fails.
     *
     * @throws ModelError for an unknown metric or a rejected value
     * @throws ParsingError if text does not match the metric's kind
     */
    Task& record(const std::string& task_name,
                 const std::string& metric_lookup,
                 const std::string& text);

private:
    std::string name_;
    std::optional<std::string> organization_;
    std::optional<std::string> description_;
    std::optional<std::int64_t> id_;
    std::vector<Metric> metrics_;
    std::map<std::string, Task> tasks_;
};

} // namespace maxify

#endif // MAXIFY_PROJECT_HPP
