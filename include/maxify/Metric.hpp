/**
 * @file Metric.hpp
 * @brief Named measurement definition owned by a project
 */

#ifndef MAXIFY_METRIC_HPP
#define MAXIFY_METRIC_HPP

#include "maxify/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace maxify {

/**
 * @brief A metric definition: name, value kind and constraints
 *
 * Allowed and default values are held in parsed form and always match
 * the declared kind. The aggregation policy is derived from the kind.
 */
class Metric {
public:
    /**
     * @brief Construct a definition
     * @param name Metric name, unique within its project
     * @param kind Declared value kind
     * @param description Optional free text
     * @param allowed_values Optional closed set of permitted values
     * @param default_value Optional default, must be allowed if a set is given
     * @throws ConfigError if the definition violates its own invariants
     */
    Metric(std::string name,
           ValueKind kind,
           std::optional<std::string> description = std::nullopt,
           std::optional<std::vector<Value>> allowed_values = std::nullopt,
           std::optional<Value> default_value = std::nullopt);

    const std::string& name() const noexcept { return name_; }
    ValueKind kind() const noexcept { return kind_; }
    const std::optional<std::string>& description() const noexcept { return description_; }
    const std::optional<std::vector<Value>>& allowed_values() const noexcept { return allowed_values_; }
    const std::optional<Value>& default_value() const noexcept { return default_value_; }

    AggregationPolicy aggregation() const noexcept { return aggregation_policy(kind_); }
    bool is_cumulative() const noexcept {
        return aggregation() == AggregationPolicy::HistogramAppend;
    }

    /**
     * @brief Parse text with this metric's unit parser
     * @throws ParsingError
     */
    Value parse(const std::string& text) const;

    /**
     * @brief Check that a value may be written to this metric
     * @throws ModelError on kind mismatch
     * @throws ValueNotAllowedError if the value is outside allowed_values
     */
    void validate(const Value& value) const;

    bool is_allowed(const Value& value) const;

    /**
     * @brief Replace description, allowed values and default from a
     *        definition of the same name and kind
     * @throws ModelError if the kinds differ
     */
    void refresh_from(const Metric& other);

    void set_description(std::optional<std::string> description) {
        description_ = std::move(description);
    }

private:
    std::string name_;
    ValueKind kind_;
    std::optional<std::string> description_;
    std::optional<std::vector<Value>> allowed_values_;
    std::optional<Value> default_value_;

    void check_definition() const;
};

} // namespace maxify

#endif // MAXIFY_METRIC_HPP
