/**
 * @file value_parser_tests.cpp
 * @brief Unit tests for the duration, time constraint and JSON string grammar.
 */
#include <gtest/gtest.h>
#include "giantt/common/errors.hpp"
#include "giantt/parser/value_parser.hpp"

using namespace giantt;

// ============================================================================
// Duration Tests
// ============================================================================

TEST(ValueParserTests, Duration_SingleUnit)
{
    Duration d = parse_duration("3mo");
    ASSERT_EQ(d.parts().size(), 1u);
    EXPECT_EQ(d.parts()[0].unit, DurationUnit::Months);
    EXPECT_DOUBLE_EQ(d.parts()[0].amount, 3.0);
}

TEST(ValueParserTests, Duration_CompoundAndFractional)
{
    Duration d = parse_duration("1h30min");
    EXPECT_DOUBLE_EQ(d.total_seconds(), 5400.0);
    EXPECT_EQ(d.to_string(), "1h30min");

    EXPECT_DOUBLE_EQ(parse_duration("1.5d").total_seconds(), 1.5 * 86400);
    EXPECT_EQ(parse_duration("2hours").to_string(), "2h");
}

TEST(ValueParserTests, Duration_ExtremeAmountsReadBack)
{
    for (double amount : {0.00001, 1.25e-7, 1.5e16, 123456789.125})
    {
        const Duration original(amount, DurationUnit::Seconds);
        const Duration parsed = parse_duration(original.to_string());
        ASSERT_EQ(parsed.parts().size(), 1u) << original.to_string();
        EXPECT_EQ(parsed.parts()[0].amount, amount) << original.to_string();
    }
}

TEST(ValueParserTests, Duration_Errors)
{
    EXPECT_THROW(parse_duration(""), ParseError);
    EXPECT_THROW(parse_duration("3"), ParseError);
    EXPECT_THROW(parse_duration("3x"), ParseError);
    EXPECT_THROW(parse_duration("1.d"), ParseError);
    EXPECT_THROW(parse_duration("1d extra"), ParseError);
}

TEST(ValueParserTests, Duration_ErrorReportsColumn)
{
    try
    {
        parse_duration("2d5q");
        FAIL() << "expected ParseError";
    }
    catch (const ParseError& e)
    {
        EXPECT_EQ(e.column(), 3u);
        EXPECT_EQ(e.input(), "2d5q");
        EXPECT_EQ(e.code(), GianttErrorCode::ParseFailure);
    }
}

// ============================================================================
// Time Constraint Tests
// ============================================================================

TEST(ValueParserTests, Constraint_WindowWithGrace)
{
    TimeConstraint c = parse_time_constraint("window(5d:2d,severe)");
    const auto* window = std::get_if<WindowConstraint>(&c.schedule);
    ASSERT_NE(window, nullptr);
    EXPECT_EQ(window->duration, Duration(5, DurationUnit::Days));
    ASSERT_TRUE(c.grace().has_value());
    EXPECT_EQ(*c.grace(), Duration(2, DurationUnit::Days));
    EXPECT_EQ(c.consequence.kind, ConsequenceKind::Severe);
    EXPECT_EQ(c.to_string(), "window(5d:2d,severe)");
}

TEST(ValueParserTests, Constraint_DeadlineWithEscalation)
{
    TimeConstraint c = parse_time_constraint("due(2024-12-31,escalate:!!)");
    const auto* deadline = std::get_if<DeadlineConstraint>(&c.schedule);
    ASSERT_NE(deadline, nullptr);
    EXPECT_EQ(deadline->due_date, "2024-12-31");
    EXPECT_FALSE(c.grace().has_value());
    EXPECT_EQ(c.consequence.kind, ConsequenceKind::Escalating);
    EXPECT_EQ(c.consequence.rate, Priority::High);
    EXPECT_EQ(c.to_string(), "due(2024-12-31,escalate:!!)");
}

TEST(ValueParserTests, Constraint_RecurringStack)
{
    TimeConstraint c = parse_time_constraint("every(1w:1d,warn,stack)");
    const auto* recurring = std::get_if<RecurringConstraint>(&c.schedule);
    ASSERT_NE(recurring, nullptr);
    EXPECT_TRUE(recurring->stack);
    EXPECT_EQ(recurring->interval, Duration(1, DurationUnit::Weeks));
    EXPECT_EQ(c.consequence.kind, ConsequenceKind::Warn);
    EXPECT_EQ(c.to_string(), "every(1w:1d,warn,stack)");
}

TEST(ValueParserTests, Constraint_LegacyEscalatingForm)
{
    TimeConstraint c = parse_time_constraint("window(3d,escalating,escalate:...)");
    EXPECT_EQ(c.consequence.kind, ConsequenceKind::Escalating);
    EXPECT_EQ(c.consequence.rate, Priority::Low);
    EXPECT_EQ(c.to_string(), "window(3d,escalate:...)");
}

TEST(ValueParserTests, Constraint_Errors)
{
    EXPECT_THROW(parse_time_constraint("soon(3d,warn)"), ParseError);
    EXPECT_THROW(parse_time_constraint("window(3d)"), ParseError);
    EXPECT_THROW(parse_time_constraint("window(3d,panic)"), ParseError);
    EXPECT_THROW(parse_time_constraint("due(2024-13-01,warn)"), ParseError);
    EXPECT_THROW(parse_time_constraint("due(24-1-1,warn)"), ParseError);
    EXPECT_THROW(parse_time_constraint("every(1d,warn,pile)"), ParseError);
    EXPECT_THROW(parse_time_constraint("every(1d,warn"), ParseError);
}

// ============================================================================
// JSON String Tests
// ============================================================================

TEST(ValueParserTests, JsonString_UnescapesAndAdvances)
{
    Scanner scanner(R"("say \"hi\"\n" rest)");
    EXPECT_EQ(parse_json_string(scanner), "say \"hi\"\n");
    EXPECT_EQ(scanner.rest(), " rest");
}

TEST(ValueParserTests, JsonString_Unicode)
{
    Scanner scanner(R"("café ☕")");
    EXPECT_EQ(parse_json_string(scanner), "café ☕");
    EXPECT_TRUE(scanner.at_end());
}

TEST(ValueParserTests, JsonString_Errors)
{
    Scanner unquoted("plain");
    EXPECT_THROW(parse_json_string(unquoted), ParseError);
    Scanner unterminated(R"("open)");
    EXPECT_THROW(parse_json_string(unterminated), ParseError);
    Scanner bad_escape(R"("\q")");
    EXPECT_THROW(parse_json_string(bad_escape), ParseError);
}

TEST(ValueParserTests, JsonString_EncodeQuotesAndEscapes)
{
    EXPECT_EQ(to_json_string("a \"b\""), R"("a \"b\"")");
    EXPECT_EQ(to_json_string("tab\t"), R"("tab\t")");
}
