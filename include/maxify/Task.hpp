/**
 * @file Task.hpp
 * @brief Unit of work and its recorded data points
 */

#ifndef MAXIFY_TASK_HPP
#define MAXIFY_TASK_HPP

#include "maxify/Metric.hpp"
#include "maxify/Value.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace maxify {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief One recorded value
 *
 * Scalar data points are identified by (task, metric) and carry an empty
 * entry_id. Histogram entries additionally carry a generated entry_id.
 */
struct DataPoint {
    std::string metric;
    Value value;
    TimePoint timestamp;
    std::string entry_id;
};

class Task {
public:
    explicit Task(std::string name, std::optional<std::string> description = std::nullopt);

    /**
     * @brief Restore a persisted task with its timestamps
     */
    Task(std::string name,
         std::optional<std::string> description,
         TimePoint created_at,
         TimePoint last_updated_at);

    const std::string& name() const noexcept { return name_; }
    const std::optional<std::string>& description() const noexcept { return description_; }
    void set_description(std::optional<std::string> description) {
        description_ = std::move(description);
    }

    TimePoint created_at() const noexcept { return created_at_; }
    TimePoint last_updated_at() const noexcept { return last_updated_at_; }

    /**
     * @brief Record a parsed value against a metric
     *
     * Integer and Decimal values are added to the current value, String
     * values replace it and Duration values are appended as new histogram
     * entries. On success last_updated_at is bumped. On failure nothing
     * changes.
     *
     * @throws ModelError if the value fails metric validation or the
     *         accumulated value cannot be represented
     */
    void record(const Metric& metric, const Value& value);

    /**
     * @brief Current value (scalar) or sum of entries (histogram)
     *
     * A histogram metric without entries totals to a zero duration. A
     * scalar metric without a data point has no total.
     */
    std::optional<Value> total(const Metric& metric) const;

    /**
     * @brief total(), falling back to the metric's default value
     */
    std::optional<Value> value_or_default(const Metric& metric) const;

    /**
     * @brief Scalar data point for a metric, nullptr if none
     */
    const DataPoint* data_point(const std::string& metric) const;

    /**
     * @brief Histogram entries for a metric in recording order
     */
    std::vector<DataPoint> entries(const std::string& metric) const;

    const std::vector<DataPoint>& data_points() const noexcept { return points_; }

    bool has_data(const std::string& metric) const;

    /**
     * @brief Add a persisted data point without validation or timestamp bump
     */
    void load_data_point(DataPoint point);

    /**
     * @brief Drop every data point of a metric
     * @return Number of removed data points
     */
    std::size_t remove_metric_data(const std::string& metric);

private:
    std::string name_;
    std::optional<std::string> description_;
    TimePoint created_at_;
    TimePoint last_updated_at_;
    std::vector<DataPoint> points_;

    void touch();
};

} // namespace maxify

#endif // MAXIFY_TASK_HPP
