/**
 * @file Units.hpp
 * @brief Text-to-Value parsing and Value-to-text formatting per value kind
 *
 * Every metric declares its ValueKind up front, and the kind selects the
 * parser. There is no guessing of a kind from text.
 *
 * Duration grammar (first match wins):
 * - Clock format "H:MM:SS" or "H:MM" -> hours*3600 + minutes*60 + seconds
 * - One or more "<unit><number>" / "<number><unit>" tokens separated by
 *   whitespace or commas, summed exactly. Units (case-insensitive):
 *   days|day|d, hours|hour|hrs|hr|h, minutes|minute|mins|min|m,
 *   seconds|second|secs|sec|s
 * - Anything else, including text with no tokens, is a ParsingError
 */

#ifndef MAXIFY_UNITS_HPP
#define MAXIFY_UNITS_HPP

#include "maxify/Value.hpp"

#include <cstdint>
#include <string>

namespace maxify {

/**
 * @brief Parse base-10 integer text
 *
 * ```cpp
 * parse_integer("500")     // → 500
 * parse_integer("-17")     // → -17
 * parse_integer("500.5")   // throws ParsingError
 * ```
 *
 * @throws ParsingError if text is not an integer or does not fit int64
 */
std::int64_t parse_integer(const std::string& text);

/**
 * @brief Parse exact decimal text
 *
 * ```cpp
 * parse_decimal("500.5")   // → 500.5 (exact)
 * parse_decimal("5a")      // throws ParsingError
 * ```
 */
Decimal parse_decimal(const std::string& text);

/**
 * @brief Parse a duration expression into exact seconds
 *
 * ```cpp
 * parse_duration("10:05:01")       // → 36301
 * parse_duration("10:05")          // → 36300
 * parse_duration("4.5 hours")      // → 16200
 * parse_duration("2 hrs, 5 mins")  // → 7500
 * parse_duration("hrs 2, 5 mins")  // → 7500
 * parse_duration("525s")           // → 525
 * parse_duration("2 weeks")        // throws ParsingError (unknown unit)
 * parse_duration("")               // throws ParsingError (no tokens)
 * ```
 */
Duration parse_duration(const std::string& text);

/**
 * @brief Identity parser for free text
 */
std::string parse_string(const std::string& text);

/**
 * @brief Parse text with the parser selected by kind
 */
Value parse_value(ValueKind kind, const std::string& text);

/**
 * @brief Parse a metric type identifier
 *
 * Case-insensitive: Integer|Int, Decimal|Number|Float,
 * Duration|Time, String|Str|Text.
 *
 * @throws ConfigError for an unknown identifier
 */
ValueKind parse_value_kind(const std::string& name);

/**
 * @brief Canonical identifier of a kind ("Integer", "Decimal", ...)
 */
std::string value_kind_name(ValueKind kind);

/**
 * @brief Add two values of the same numeric kind
 * @throws ModelError if kinds differ or the kind is String
 */
Value add_values(const Value& lhs, const Value& rhs);

/**
 * @brief Render an integer or decimal with thousands separators
 *
 * ```cpp
 * format_number(Decimal(1000000))          // → "1,000,000"
 * format_number(Decimal::parse("1500.56")) // → "1,500.56"
 * ```
 */
std::string format_number(const Decimal& value);

/**
 * @brief Render a duration for display
 *
 * ```cpp
 * format_duration(Duration(Decimal(86500)))  // → "1 day, 0:01:40"
 * format_duration(Duration(Decimal(305)))    // → "0:05:05"
 * format_duration(Duration(Decimal::parse("4.5")))  // → "0:00:04.500000"
 * ```
 *
 * Display only; the result is not guaranteed to parse back.
 */
std::string format_duration(const Duration& value);

/**
 * @brief Render any value for display
 */
std::string format_value(const Value& value);

} // namespace maxify

#endif // MAXIFY_UNITS_HPP
