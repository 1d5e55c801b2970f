/**
 * @file Units.cpp
 * @brief Implementation of value parsing and formatting
 */

#include "maxify/Units.hpp"
#include "maxify/Errors.hpp"
#include "maxify/Util.hpp"

#include <iomanip>
#include <limits>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace maxify {

namespace {

    /// Duration unit synonyms mapped to their length in seconds
    const std::vector<std::pair<std::set<std::string>, std::int64_t>>& duration_units() {
        static const std::vector<std::pair<std::set<std::string>, std::int64_t>> units = {
            {{"days", "day", "d"}, 86400},
            {{"hours", "hour", "hrs", "hr", "h"}, 3600},
            {{"minutes", "minute", "mins", "min", "m"}, 60},
            {{"seconds", "second", "secs", "sec", "s"}, 1},
        };
        return units;
    }

    /**
     * @brief Try "H:MM:SS" / "H:MM" clock format
     * @return true and sets out if text is a valid clock time
     */
    bool try_parse_clock(const std::string& text, Duration& out) {
        static const std::regex clock_re(R"(^(\d{1,2}):(\d{1,2})(?::(\d{1,2}))?$)");
        std::smatch m;
        if (!std::regex_match(text, m, clock_re)) {
            return false;
        }

        const int hours = std::stoi(m[1].str());
        const int minutes = std::stoi(m[2].str());
        const int seconds = m[3].matched ? std::stoi(m[3].str()) : 0;
        if (hours > 23 || minutes > 59 || seconds > 59) {
            return false;
        }

        out = Duration(Decimal(hours * 3600 + minutes * 60 + seconds));
        return true;
    }

    bool is_separator_only(const std::string& gap) {
        return gap.find_first_not_of(" \t\r\n,") == std::string::npos;
    }

    /**
     * @brief Insert thousands separators into a run of digits
     */
    std::string group_thousands(const std::string& digits) {
        std::string out;
        const size_t n = digits.size();
        for (size_t i = 0; i < n; ++i) {
            if (i > 0 && (n - i) % 3 == 0) out += ',';
            out += digits[i];
        }
        return out;
    }
}

std::int64_t parse_integer(const std::string& text) {
    const std::string s = trim(text);
    static const std::regex integer_re("^[+-]?[0-9]+$");
    if (!std::regex_match(s, integer_re)) {
        throw ParsingError("Integer", text);
    }

    try {
        size_t pos = 0;
        long long val = std::stoll(s, &pos);
        if (pos == s.size()) {
            return static_cast<std::int64_t>(val);
        }
    } catch (const std::out_of_range&) {
        // Fall through to the error below
    }
    throw ParsingError("Integer", text);
}

Decimal parse_decimal(const std::string& text) {
    return Decimal::parse(text);
}

Duration parse_duration(const std::string& text) {
    const std::string s = trim(text);

    // Clock format and unit expressions are mutually exclusive.
    Duration clock;
    if (try_parse_clock(s, clock)) {
        return clock;
    }

    static const std::regex token_re(
        R"(([A-Za-z]+)\s*(\d+\.?\d*)|(\d+\.?\d*)\s*([A-Za-z]+))");

    Decimal total;
    size_t matched = 0;
    size_t last_end = 0;

    for (auto it = std::sregex_iterator(s.begin(), s.end(), token_re);
         it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        const size_t start = static_cast<size_t>(m.position(0));

        const std::string gap = s.substr(last_end, start - last_end);
        if (!is_separator_only(gap)) {
            throw ParsingError("Duration", text, trim(gap));
        }
        last_end = start + static_cast<size_t>(m.length(0));

        const std::string token = m.str(0);
        const std::string unit = to_lower(m[1].matched ? m.str(1) : m.str(4));
        const std::string number = m[1].matched ? m.str(2) : m.str(3);

        std::int64_t multiplier = 0;
        for (const auto& [names, seconds] : duration_units()) {
            if (names.count(unit) > 0) {
                multiplier = seconds;
                break;
            }
        }
        if (multiplier == 0) {
            throw ParsingError("Duration", text, token);
        }

        try {
            total += Decimal::parse(number) * Decimal(multiplier);
        } catch (const ParsingError&) {
            throw ParsingError("Duration", text, token);
        } catch (const std::overflow_error&) {
            throw ParsingError("Duration", text, token);
        }
        ++matched;
    }

    const std::string tail = s.substr(last_end);
    if (!is_separator_only(tail)) {
        throw ParsingError("Duration", text, trim(tail));
    }
    if (matched == 0) {
        throw ParsingError("Duration", text);
    }

    return Duration(total);
}

std::string parse_string(const std::string& text) {
    return text;
}

Value parse_value(ValueKind kind, const std::string& text) {
    switch (kind) {
        case ValueKind::Integer:
            return parse_integer(text);
        case ValueKind::Decimal:
            return parse_decimal(text);
        case ValueKind::Duration:
            return parse_duration(text);
        case ValueKind::String:
        default:
            return parse_string(text);
    }
}

ValueKind parse_value_kind(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "integer" || lower == "int") {
        return ValueKind::Integer;
    }
    if (lower == "decimal" || lower == "number" || lower == "float") {
        return ValueKind::Decimal;
    }
    if (lower == "duration" || lower == "time") {
        return ValueKind::Duration;
    }
    if (lower == "string" || lower == "str" || lower == "text") {
        return ValueKind::String;
    }
    throw ConfigError("Unknown metric type: '" + name + "'");
}

std::string value_kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Integer: return "Integer";
        case ValueKind::Decimal: return "Decimal";
        case ValueKind::Duration: return "Duration";
        case ValueKind::String: return "String";
    }
    return "Unknown";
}

Value add_values(const Value& lhs, const Value& rhs) {
    const ValueKind kind = value_kind_of(lhs);
    if (kind != value_kind_of(rhs)) {
        throw ModelError("Cannot add " + value_kind_name(value_kind_of(rhs))
                         + " value to " + value_kind_name(kind) + " value");
    }

    try {
        switch (kind) {
            case ValueKind::Integer: {
                const std::int64_t a = std::get<std::int64_t>(lhs);
                const std::int64_t b = std::get<std::int64_t>(rhs);
                if ((b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) ||
                    (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b)) {
                    throw std::overflow_error("Integer addition overflow");
                }
                return a + b;
            }
            case ValueKind::Decimal:
                return std::get<Decimal>(lhs) + std::get<Decimal>(rhs);
            case ValueKind::Duration:
                return std::get<Duration>(lhs) + std::get<Duration>(rhs);
            case ValueKind::String:
            default:
                break;
        }
    } catch (const std::overflow_error& e) {
        throw ModelError(e.what());
    }
    throw ModelError("String values cannot be accumulated");
}

std::string format_number(const Decimal& value) {
    std::string text = value.abs().to_string();
    std::string fraction;
    const auto dot = text.find('.');
    if (dot != std::string::npos) {
        fraction = text.substr(dot);
        text.erase(dot);
    }
    return (value.sign() < 0 ? "-" : "") + group_thousands(text) + fraction;
}

std::string format_duration(const Duration& value) {
    const Decimal& seconds = value.seconds();
    const std::int64_t micros = seconds.abs().scaled(6);

    std::int64_t whole = micros / 1000000;
    const std::int64_t fraction = micros % 1000000;

    const std::int64_t days = whole / 86400;
    whole %= 86400;
    const std::int64_t hours = whole / 3600;
    whole %= 3600;
    const std::int64_t minutes = whole / 60;
    const std::int64_t secs = whole % 60;

    std::ostringstream oss;
    if (seconds.sign() < 0) {
        oss << "-";
    }
    if (days > 0) {
        oss << days << (days == 1 ? " day, " : " days, ");
    }
    oss << hours << ":"
        << std::setw(2) << std::setfill('0') << minutes << ":"
        << std::setw(2) << std::setfill('0') << secs;
    if (fraction != 0) {
        oss << "." << std::setw(6) << std::setfill('0') << fraction;
    }
    return oss.str();
}

std::string format_value(const Value& value) {
    switch (value_kind_of(value)) {
        case ValueKind::Integer:
            return format_number(Decimal(std::get<std::int64_t>(value)));
        case ValueKind::Decimal:
            return format_number(std::get<Decimal>(value));
        case ValueKind::Duration:
            return format_duration(std::get<Duration>(value));
        case ValueKind::String:
        default:
            return std::get<std::string>(value);
    }
}

} // namespace maxify
