/**
 * @file Task.cpp
 * @brief Implementation of task recording and totals
 */

#include "maxify/Task.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Units.hpp"
#include "maxify/Util.hpp"

#include <algorithm>

namespace maxify {

Task::Task(std::string name, std::optional<std::string> description)
    : name_(std::move(name))
    , description_(std::move(description))
    , created_at_(Clock::now())
    , last_updated_at_(created_at_)
{
    if (name_.empty()) {
        throw ModelError("Task name must not be empty");
    }
}

Task::Task(std::string name,
           std::optional<std::string> description,
           TimePoint created_at,
           TimePoint last_updated_at)
    : name_(std::move(name))
    , description_(std::move(description))
    , created_at_(created_at)
    , last_updated_at_(std::max(created_at, last_updated_at))
{}

void Task::touch() {
    last_updated_at_ = std::max(Clock::now(), last_updated_at_);
}

void Task::record(const Metric& metric, const Value& value) {
    metric.validate(value);

    const TimePoint now = Clock::now();

    switch (metric.aggregation()) {
        case AggregationPolicy::HistogramAppend: {
            DataPoint entry{metric.name(), value, now, generate_id()};
            points_.push_back(std::move(entry));
            break;
        }
        case AggregationPolicy::ScalarAccumulate:
        case AggregationPolicy::ScalarOverwrite: {
            auto it = std::find_if(points_.begin(), points_.end(), [&](const DataPoint& p) {
                return p.metric == metric.name();
            });
            if (it == points_.end()) {
                points_.push_back(DataPoint{metric.name(), value, now, std::string()});
                break;
            }
            // Compute before assigning so a failed addition leaves the point as is.
            Value updated = metric.aggregation() == AggregationPolicy::ScalarAccumulate
                ? add_values(it->value, value)
                : value;
            it->value = std::move(updated);
            it->timestamp = now;
            break;
        }
    }

    touch();
}

std::optional<Value> Task::total(const Metric& metric) const {
    if (metric.is_cumulative()) {
        Value sum = Duration();
        for (const auto& p : points_) {
            if (p.metric == metric.name()) {
                sum = add_values(sum, p.value);
            }
        }
        return sum;
    }

    const DataPoint* point = data_point(metric.name());
    if (!point) {
        return std::nullopt;
    }
    return point->value;
}

std::optional<Value> Task::value_or_default(const Metric& metric) const {
    if (metric.is_cumulative() && !has_data(metric.name()) && metric.default_value()) {
        return metric.default_value();
    }
    auto value = total(metric);
    if (value) {
        return value;
    }
    return metric.default_value();
}

const DataPoint* Task::data_point(const std::string& metric) const {
    for (const auto& p : points_) {
        if (p.metric == metric && p.entry_id.empty()) {
            return &p;
        }
    }
    return nullptr;
}

std::vector<DataPoint> Task::entries(const std::string& metric) const {
    std::vector<DataPoint> out;
    for (const auto& p : points_) {
        if (p.metric == metric && !p.entry_id.empty()) {
            out.push_back(p);
        }
    }
    return out;
}

bool Task::has_data(const std::string& metric) const {
    return std::any_of(points_.begin(), points_.end(), [&](const DataPoint& p) {
        return p.metric == metric;
    });
}

void Task::load_data_point(DataPoint point) {
    points_.push_back(std::move(point));
}

std::size_t Task::remove_metric_data(const std::string& metric) {
    const auto before = points_.size();
    points_.erase(std::remove_if(points_.begin(), points_.end(), [&](const DataPoint& p) {
        return p.metric == metric;
    }), points_.end());
    return before - points_.size();
}

} // namespace maxify
