/**
 * @file Value.hpp
 * @brief Typed metric values and the definition document model
 *
 * A metric value is one of:
 * - Integer (int64_t)
 * - Decimal (exact base-10 number)
 * - Duration (exact number of seconds)
 * - String (std::string, UTF-8)
 *
 * Definition documents (JSON or TOML project files, settings files) are
 * decoded into nlohmann::json before they are validated.
 */

#ifndef MAXIFY_VALUE_HPP
#define MAXIFY_VALUE_HPP

#include "maxify/Decimal.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace maxify {

/**
 * @brief Declared type of a metric's values
 *
 * Enumerator order matches the alternatives of Value.
 */
enum class ValueKind {
    Integer,
    Decimal,
    Duration,
    String
};

/**
 * @brief How repeated writes to the same (task, metric) combine
 */
enum class AggregationPolicy {
    ScalarAccumulate,   ///< one value, new writes are added to it
    ScalarOverwrite,    ///< one value, new writes replace it
    HistogramAppend     ///< many immutable entries, total is their sum
};

/**
 * @brief Span of time measured in exact seconds
 */
class Duration {
public:
    Duration() = default;
    explicit Duration(Decimal seconds) : seconds_(std::move(seconds)) {}

    const Decimal& seconds() const noexcept { return seconds_; }

    Duration& operator+=(const Duration& other) {
        seconds_ += other.seconds_;
        return *this;
    }

    friend Duration operator+(Duration lhs, const Duration& rhs) { return lhs += rhs; }

    friend bool operator==(const Duration& a, const Duration& b) noexcept {
        return a.seconds_ == b.seconds_;
    }
    friend bool operator!=(const Duration& a, const Duration& b) noexcept { return !(a == b); }
    friend bool operator<(const Duration& a, const Duration& b) noexcept {
        return a.seconds_ < b.seconds_;
    }

private:
    Decimal seconds_;
};

/**
 * @brief A parsed metric value
 */
using Value = std::variant<std::int64_t, Decimal, Duration, std::string>;

/**
 * @brief Decoded definition or settings document
 */
using Document = nlohmann::json;

/**
 * @brief Kind of a parsed value
 */
inline ValueKind value_kind_of(const Value& value) {
    return static_cast<ValueKind>(value.index());
}

/**
 * @brief Aggregation policy implied by a value kind
 */
inline AggregationPolicy aggregation_policy(ValueKind kind) {
    switch (kind) {
        case ValueKind::Duration:
            return AggregationPolicy::HistogramAppend;
        case ValueKind::String:
            return AggregationPolicy::ScalarOverwrite;
        case ValueKind::Integer:
        case ValueKind::Decimal:
        default:
            return AggregationPolicy::ScalarAccumulate;
    }
}

/**
 * @brief Get human-readable type name for a document node
 * @param val The node to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Document& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace maxify

#endif // MAXIFY_VALUE_HPP
