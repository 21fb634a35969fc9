/**
 * @file value_parser.cpp
 */
#include "giantt/parser/value_parser.hpp"
#include "giantt/common/errors.hpp"

#include <cctype>

#include <nlohmann/json.hpp>

namespace giantt
{

namespace
{

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_alpha(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// Escalation rate glyphs, longest first.
constexpr std::array<Priority, 6> k_rate_glyph_order{
    Priority::Critical,
    Priority::High,
    Priority::Medium,
    Priority::Unsure,
    Priority::Low,
    Priority::Lowest,
};

Priority parse_rate(Scanner& scanner)
{
    for (Priority priority : k_rate_glyph_order)
    {
        if (scanner.accept(priority_symbol(priority)))
        {
            return priority;
        }
    }
    return Priority::Neutral;
}

Consequence parse_consequence(Scanner& scanner)
{
    if (scanner.accept("severe"))
    {
        return Consequence{ConsequenceKind::Severe, Priority::Neutral};
    }
    if (scanner.accept("warn"))
    {
        return Consequence{ConsequenceKind::Warn, Priority::Neutral};
    }
    if (scanner.accept("escalating"))
    {
        // Older files spell the rate as a separate "escalate:" argument.
        Consequence consequence{ConsequenceKind::Escalating, Priority::Neutral};
        if (scanner.accept(",escalate:"))
        {
            consequence.rate = parse_rate(scanner);
        }
        return consequence;
    }
    if (scanner.accept("escalate:"))
    {
        return Consequence{ConsequenceKind::Escalating, parse_rate(scanner)};
    }
    scanner.fail("expected consequence (severe, warn or escalate:<rate>)");
}

std::optional<Duration> parse_grace(Scanner& scanner)
{
    if (!scanner.accept(":"))
    {
        return std::nullopt;
    }
    return parse_duration(scanner);
}

int read_fixed_digits(Scanner& scanner, size_t count)
{
    const size_t start = scanner.position();
    std::string_view digits = scanner.take_while(is_digit);
    if (digits.size() != count)
    {
        scanner.fail_at(start, "expected date in YYYY-MM-DD form");
    }
    return std::stoi(std::string(digits));
}

std::string parse_date(Scanner& scanner)
{
    const size_t start = scanner.position();
    read_fixed_digits(scanner, 4);
    scanner.expect("-", "'-' in date");
    const int month = read_fixed_digits(scanner, 2);
    scanner.expect("-", "'-' in date");
    const int day = read_fixed_digits(scanner, 2);
    if (month < 1 || month > 12 || day < 1 || day > 31)
    {
        scanner.fail_at(start, "date out of range");
    }
    return std::string(scanner.text().substr(start, scanner.position() - start));
}

} // namespace

// ============================================================================
// Durations
// ============================================================================

Duration parse_duration(Scanner& scanner)
{
    std::vector<DurationPart> parts;
    while (is_digit(scanner.peek()))
    {
        std::string number(scanner.take_while(is_digit));
        if (scanner.accept("."))
        {
            std::string_view fraction = scanner.take_while(is_digit);
            if (fraction.empty())
            {
                scanner.fail("expected digits after decimal point");
            }
            number += '.';
            number += fraction;
        }
        const size_t unit_pos = scanner.position();
        std::string_view unit_text = scanner.take_while(is_alpha);
        if (unit_text.empty())
        {
            scanner.fail("expected duration unit");
        }
        auto unit = unit_from_symbol(unit_text);
        if (!unit)
        {
            scanner.fail_at(unit_pos, "unknown duration unit '" + std::string(unit_text) + "'");
        }
        parts.push_back(DurationPart{std::stod(number), *unit});
    }
    if (parts.empty())
    {
        scanner.fail("expected duration");
    }
    return Duration(std::move(parts));
}

Duration parse_duration(std::string_view text)
{
    Scanner scanner(trim(text));
    Duration duration = parse_duration(scanner);
    if (!scanner.at_end())
    {
        scanner.fail("unexpected text after duration");
    }
    return duration;
}

// ============================================================================
// Time constraints
// ============================================================================

TimeConstraint parse_time_constraint(Scanner& scanner)
{
    const size_t start = scanner.position();
    std::string keyword(scanner.take_while(is_alpha));
    if (keyword != "window" && keyword != "due" && keyword != "every")
    {
        scanner.fail_at(start, "unknown time constraint '" + keyword + "'");
    }
    scanner.expect("(", "'(' after '" + keyword + "'");

    TimeConstraint constraint;
    if (keyword == "window")
    {
        WindowConstraint window;
        window.duration = parse_duration(scanner);
        window.grace = parse_grace(scanner);
        scanner.expect(",", "',' before consequence");
        constraint.consequence = parse_consequence(scanner);
        constraint.schedule = std::move(window);
    }
    else if (keyword == "due")
    {
        DeadlineConstraint deadline;
        deadline.due_date = parse_date(scanner);
        deadline.grace = parse_grace(scanner);
        scanner.expect(",", "',' before consequence");
        constraint.consequence = parse_consequence(scanner);
        constraint.schedule = std::move(deadline);
    }
    else
    {
        RecurringConstraint recurring;
        recurring.interval = parse_duration(scanner);
        recurring.grace = parse_grace(scanner);
        scanner.expect(",", "',' before consequence");
        constraint.consequence = parse_consequence(scanner);
        if (scanner.accept(","))
        {
            scanner.expect("stack", "'stack'");
            recurring.stack = true;
        }
        constraint.schedule = std::move(recurring);
    }
    scanner.expect(")", "')' closing '" + keyword + "'");
    return constraint;
}

TimeConstraint parse_time_constraint(std::string_view text)
{
    Scanner scanner(trim(text));
    TimeConstraint constraint = parse_time_constraint(scanner);
    if (!scanner.at_end())
    {
        scanner.fail("unexpected text after time constraint");
    }
    return constraint;
}

// ============================================================================
// JSON string literals
// ============================================================================

std::string parse_json_string(Scanner& scanner)
{
    const size_t start = scanner.position();
    if (scanner.peek() != '"')
    {
        scanner.fail("expected '\"' starting a JSON string");
    }
    std::string_view rest = scanner.rest();
    size_t end = 1;
    bool closed = false;
    while (end < rest.size())
    {
        if (rest[end] == '\\')
        {
            end += 2;
            continue;
        }
        if (rest[end] == '"')
        {
            closed = true;
            break;
        }
        ++end;
    }
    if (!closed)
    {
        scanner.fail("unterminated JSON string");
    }

    std::string literal(rest.substr(0, end + 1));
    nlohmann::json value;
    try
    {
        value = nlohmann::json::parse(literal);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        scanner.fail_at(start, std::string("invalid JSON string: ") + e.what());
    }
    scanner.accept(literal);
    return value.get<std::string>();
}

std::string to_json_string(const std::string& text)
{
    return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace giantt
