/**
 * @file test_units.cpp
 * @brief Tests for value parsing and formatting
 */

#include <gtest/gtest.h>
#include "maxify/Errors.hpp"
#include "maxify/Units.hpp"

#include <limits>

using namespace maxify;

namespace {

Decimal seconds_of(const std::string& text) {
    return parse_duration(text).seconds();
}

} // anonymous namespace

// ============================================================================
// Integer and Decimal parsing
// ============================================================================

TEST(ParseInteger, Valid) {
    EXPECT_EQ(parse_integer("500"), 500);
    EXPECT_EQ(parse_integer("-17"), -17);
    EXPECT_EQ(parse_integer(" 42 "), 42);
}

TEST(ParseInteger, Invalid) {
    EXPECT_THROW(parse_integer("500.5"), ParsingError);
    EXPECT_THROW(parse_integer("5a"), ParsingError);
    EXPECT_THROW(parse_integer(""), ParsingError);
    EXPECT_THROW(parse_integer("99999999999999999999"), ParsingError);
}

TEST(ParseDecimal, Exact) {
    EXPECT_EQ(parse_decimal("500.5"), Decimal::from_parts(5005, 1));
    EXPECT_THROW(parse_decimal("5a"), ParsingError);
}

// ============================================================================
// Duration parsing
// ============================================================================

TEST(ParseDuration, ClockFormat) {
    EXPECT_EQ(seconds_of("10:05:01"), Decimal(36301));
    EXPECT_EQ(seconds_of("10:05"), Decimal(36300));
    EXPECT_EQ(seconds_of("0:00:59"), Decimal(59));
}

TEST(ParseDuration, ClockOutOfRangeIsRejected) {
    EXPECT_THROW(parse_duration("25:00"), ParsingError);
    EXPECT_THROW(parse_duration("10:60"), ParsingError);
}

TEST(ParseDuration, NumberThenUnit) {
    EXPECT_EQ(seconds_of("4.5 hours"), Decimal(16200));
    EXPECT_EQ(seconds_of("525s"), Decimal(525));
    EXPECT_EQ(seconds_of("1d"), Decimal(86400));
    EXPECT_EQ(seconds_of("2 days"), Decimal(172800));
    EXPECT_EQ(seconds_of("1.5 secs"), Decimal::parse("1.5"));
}

TEST(ParseDuration, UnitThenNumber) {
    EXPECT_EQ(seconds_of("hrs 2"), Decimal(7200));
    EXPECT_EQ(seconds_of("hrs 2, 5 mins"), Decimal(7500));
}

TEST(ParseDuration, MultipleTokensAreSummed) {
    EXPECT_EQ(seconds_of("2 hrs, 5 mins"), Decimal(7500));
    EXPECT_EQ(seconds_of("1h30m"), Decimal(5400));
    EXPECT_EQ(seconds_of("1 day 2 hours 3 minutes 4 seconds"), Decimal(93784));
}

TEST(ParseDuration, UnitsAreCaseInsensitive) {
    EXPECT_EQ(seconds_of("2 Hours"), Decimal(7200));
    EXPECT_EQ(seconds_of("3 MIN"), Decimal(180));
}

TEST(ParseDuration, UnknownUnitNamesToken) {
    try {
        parse_duration("2 weeks");
        FAIL() << "Expected ParsingError";
    } catch (const ParsingError& e) {
        EXPECT_EQ(e.kind(), "Duration");
        EXPECT_EQ(e.text(), "2 weeks");
        EXPECT_EQ(e.fragment(), "2 weeks");
    }
}

TEST(ParseDuration, NoTokensIsAnError) {
    EXPECT_THROW(parse_duration(""), ParsingError);
    EXPECT_THROW(parse_duration("   "), ParsingError);
    EXPECT_THROW(parse_duration("5"), ParsingError);
    EXPECT_THROW(parse_duration("soon"), ParsingError);
}

TEST(ParseDuration, TextBetweenTokensIsRejected) {
    try {
        parse_duration("2 hours; 5 mins");
        FAIL() << "Expected ParsingError";
    } catch (const ParsingError& e) {
        EXPECT_EQ(e.fragment(), ";");
    }
    // "and 5" reads as a token with an unknown unit
    EXPECT_THROW(parse_duration("2 hours and 5 mins"), ParsingError);
    EXPECT_THROW(parse_duration("4 hours 30"), ParsingError);
}

// ============================================================================
// Kinds and dispatch
// ============================================================================

TEST(ParseValue, DispatchesByKind) {
    EXPECT_EQ(parse_value(ValueKind::Integer, "7"), Value(std::int64_t(7)));
    EXPECT_EQ(parse_value(ValueKind::Decimal, "0.5"), Value(Decimal::from_parts(5, 1)));
    EXPECT_EQ(parse_value(ValueKind::Duration, "1m"), Value(Duration(Decimal(60))));
    EXPECT_EQ(parse_value(ValueKind::String, " as is "), Value(std::string(" as is ")));
}

TEST(ParseValue, NoKindGuessing) {
    // Digits are still a string for a String metric
    EXPECT_EQ(value_kind_of(parse_value(ValueKind::String, "42")), ValueKind::String);
    EXPECT_THROW(parse_value(ValueKind::Integer, "1h"), ParsingError);
}

TEST(ParseValueKind, NamesAndAliases) {
    EXPECT_EQ(parse_value_kind("Integer"), ValueKind::Integer);
    EXPECT_EQ(parse_value_kind("int"), ValueKind::Integer);
    EXPECT_EQ(parse_value_kind("Number"), ValueKind::Decimal);
    EXPECT_EQ(parse_value_kind("FLOAT"), ValueKind::Decimal);
    EXPECT_EQ(parse_value_kind("Time"), ValueKind::Duration);
    EXPECT_EQ(parse_value_kind("duration"), ValueKind::Duration);
    EXPECT_EQ(parse_value_kind("Text"), ValueKind::String);
    EXPECT_THROW(parse_value_kind("Boolean"), ConfigError);
}

TEST(ValueKindName, Canonical) {
    EXPECT_EQ(value_kind_name(ValueKind::Integer), "Integer");
    EXPECT_EQ(value_kind_name(ValueKind::Decimal), "Decimal");
    EXPECT_EQ(value_kind_name(ValueKind::Duration), "Duration");
    EXPECT_EQ(value_kind_name(ValueKind::String), "String");
}

TEST(AggregationPolicyOf, FollowsKind) {
    EXPECT_EQ(aggregation_policy(ValueKind::Integer), AggregationPolicy::ScalarAccumulate);
    EXPECT_EQ(aggregation_policy(ValueKind::Decimal), AggregationPolicy::ScalarAccumulate);
    EXPECT_EQ(aggregation_policy(ValueKind::Duration), AggregationPolicy::HistogramAppend);
    EXPECT_EQ(aggregation_policy(ValueKind::String), AggregationPolicy::ScalarOverwrite);
}

// ============================================================================
// Arithmetic
// ============================================================================

TEST(AddValues, SameKind) {
    EXPECT_EQ(add_values(std::int64_t(5), std::int64_t(10)), Value(std::int64_t(15)));
    EXPECT_EQ(add_values(Decimal::parse("0.1"), Decimal::parse("0.2")),
              Value(Decimal::parse("0.3")));
    EXPECT_EQ(add_values(Duration(Decimal(60)), Duration(Decimal(30))),
              Value(Duration(Decimal(90))));
}

TEST(AddValues, Rejected) {
    EXPECT_THROW(add_values(std::int64_t(5), Decimal(5)), ModelError);
    EXPECT_THROW(add_values(std::string("a"), std::string("b")), ModelError);
    EXPECT_THROW(add_values(std::numeric_limits<std::int64_t>::max(), std::int64_t(1)),
                 ModelError);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(FormatNumber, ThousandsSeparators) {
    EXPECT_EQ(format_number(Decimal(1000000)), "1,000,000");
    EXPECT_EQ(format_number(Decimal::parse("1500.56")), "1,500.56");
    EXPECT_EQ(format_number(Decimal(999)), "999");
    EXPECT_EQ(format_number(Decimal::parse("-1234.5")), "-1,234.5");
}

TEST(FormatDuration, Display) {
    EXPECT_EQ(format_duration(Duration(Decimal(86500))), "1 day, 0:01:40");
    EXPECT_EQ(format_duration(Duration(Decimal(2 * 86400 + 3600))), "2 days, 1:00:00");
    EXPECT_EQ(format_duration(Duration(Decimal(305))), "0:05:05");
    EXPECT_EQ(format_duration(Duration(Decimal::parse("4.5"))), "0:00:04.500000");
    EXPECT_EQ(format_duration(Duration()), "0:00:00");
    EXPECT_EQ(format_duration(Duration(Decimal(-90))), "-0:01:30");
}

TEST(FormatValue, AllKinds) {
    EXPECT_EQ(format_value(std::int64_t(1500)), "1,500");
    EXPECT_EQ(format_value(Decimal::parse("2.25")), "2.25");
    EXPECT_EQ(format_value(Duration(Decimal(36301))), "10:05:01");
    EXPECT_EQ(format_value(std::string("ok")), "ok");
}
