/**
 * @file Metric.cpp
 * @brief Implementation of metric definitions
 */

#include "maxify/Metric.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Units.hpp"

#include <algorithm>

namespace maxify {

Metric::Metric(std::string name,
               ValueKind kind,
               std::optional<std::string> description,
               std::optional<std::vector<Value>> allowed_values,
               std::optional<Value> default_value)
    : name_(std::move(name))
    , kind_(kind)
    , description_(std::move(description))
    , allowed_values_(std::move(allowed_values))
    , default_value_(std::move(default_value))
{
    check_definition();
}

void Metric::check_definition() const {
    if (name_.empty()) {
        throw ConfigError("Metric name must not be empty");
    }

    if (allowed_values_) {
        for (const auto& v : *allowed_values_) {
            if (value_kind_of(v) != kind_) {
                throw ConfigError("Allowed value " + format_value(v) + " of metric '" + name_
                                  + "' is not of type " + value_kind_name(kind_));
            }
        }
    }

    if (default_value_) {
        if (value_kind_of(*default_value_) != kind_) {
            throw ConfigError("Default value " + format_value(*default_value_) + " of metric '"
                              + name_ + "' is not of type " + value_kind_name(kind_));
        }
        if (!is_allowed(*default_value_)) {
            throw ConfigError("Default value " + format_value(*default_value_) + " of metric '"
                              + name_ + "' is not one of its allowed values");
        }
    }
}

Value Metric::parse(const std::string& text) const {
    return parse_value(kind_, text);
}

bool Metric::is_allowed(const Value& value) const {
    if (!allowed_values_) {
        return true;
    }
    return std::find(allowed_values_->begin(), allowed_values_->end(), value)
        != allowed_values_->end();
}

void Metric::validate(const Value& value) const {
    if (value_kind_of(value) != kind_) {
        throw ModelError("Metric '" + name_ + "' expects " + value_kind_name(kind_)
                         + " values, got " + value_kind_name(value_kind_of(value)));
    }
    if (!is_allowed(value)) {
        throw ValueNotAllowedError(name_, format_value(value));
    }
}

void Metric::refresh_from(const Metric& other) {
    if (other.kind_ != kind_) {
        throw ModelError("Cannot refresh metric '" + name_ + "' of type " + value_kind_name(kind_)
                         + " from a definition of type " + value_kind_name(other.kind_));
    }
    description_ = other.description_;
    allowed_values_ = other.allowed_values_;
    default_value_ = other.default_value_;
}

} // namespace maxify
