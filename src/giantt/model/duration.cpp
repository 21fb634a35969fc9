/**
 * @file duration.cpp
 */
#include "giantt/model/duration.hpp"

#include <cmath>
#include <string>

#include <spdlog/fmt/fmt.h>

namespace giantt
{

namespace
{

struct UnitInfo
{
    DurationUnit unit;
    const char* symbol;
    int64_t seconds;
};

constexpr std::array<UnitInfo, 7> k_units{{
    {DurationUnit::Seconds, "s", 1},
    {DurationUnit::Minutes, "min", 60},
    {DurationUnit::Hours, "h", 3600},
    {DurationUnit::Days, "d", 86400},
    {DurationUnit::Weeks, "w", 604800},
    {DurationUnit::Months, "mo", 2592000},
    {DurationUnit::Years, "y", 31536000},
}};

struct UnitAlias
{
    const char* alias;
    DurationUnit unit;
};

constexpr std::array<UnitAlias, 13> k_unit_aliases{{
    {"hr", DurationUnit::Hours},
    {"hour", DurationUnit::Hours},
    {"hours", DurationUnit::Hours},
    {"minute", DurationUnit::Minutes},
    {"minutes", DurationUnit::Minutes},
    {"day", DurationUnit::Days},
    {"days", DurationUnit::Days},
    {"week", DurationUnit::Weeks},
    {"weeks", DurationUnit::Weeks},
    {"month", DurationUnit::Months},
    {"months", DurationUnit::Months},
    {"year", DurationUnit::Years},
    {"years", DurationUnit::Years},
}};

/// Rewrite `d.ddde[+-]x` as plain positional notation; other text is returned as is.
std::string expand_exponent(const std::string& text)
{
    const auto e_pos = text.find_first_of("eE");
    if (e_pos == std::string::npos)
    {
        return text;
    }
    std::string mantissa = text.substr(0, e_pos);
    const int exponent = std::stoi(text.substr(e_pos + 1));
    std::string sign;
    if (!mantissa.empty() && mantissa.front() == '-')
    {
        sign = "-";
        mantissa.erase(0, 1);
    }

    const auto dot = mantissa.find('.');
    std::string digits = mantissa;
    long point = static_cast<long>(mantissa.size());
    if (dot != std::string::npos)
    {
        digits.erase(dot, 1);
        point = static_cast<long>(dot);
    }
    point += exponent;

    const long count = static_cast<long>(digits.size());
    if (point <= 0)
    {
        return sign + "0." + std::string(static_cast<size_t>(-point), '0') + digits;
    }
    if (point >= count)
    {
        return sign + digits + std::string(static_cast<size_t>(point - count), '0');
    }
    digits.insert(static_cast<size_t>(point), 1, '.');
    return sign + digits;
}

} // namespace

const char* unit_symbol(DurationUnit unit) noexcept
{
    return k_units[static_cast<size_t>(unit)].symbol;
}

int64_t unit_seconds(DurationUnit unit) noexcept
{
    return k_units[static_cast<size_t>(unit)].seconds;
}

std::optional<DurationUnit> unit_from_symbol(std::string_view symbol) noexcept
{
    for (const auto& info : k_units)
    {
        if (symbol == info.symbol)
        {
            return info.unit;
        }
    }
    for (const auto& alias : k_unit_aliases)
    {
        if (symbol == alias.alias)
        {
            return alias.unit;
        }
    }
    return std::nullopt;
}

std::string format_amount(double amount)
{
    double whole = 0.0;
    if (std::modf(amount, &whole) == 0.0 && std::fabs(whole) < 1e15)
    {
        return std::to_string(static_cast<long long>(whole));
    }
    return expand_exponent(fmt::format("{}", amount));
}

double Duration::total_seconds() const noexcept
{
    double total = 0.0;
    for (const auto& part : m_parts)
    {
        total += part.amount * static_cast<double>(unit_seconds(part.unit));
    }
    return total;
}

std::string Duration::to_string() const
{
    if (m_parts.empty())
    {
        return "0s";
    }
    std::string text;
    for (const auto& part : m_parts)
    {
        text += format_amount(part.amount);
        text += unit_symbol(part.unit);
    }
    return text;
}

Duration Duration::operator+(const Duration& other) const
{
    std::vector<DurationPart> parts = m_parts;
    parts.insert(parts.end(), other.m_parts.begin(), other.m_parts.end());
    return Duration(std::move(parts));
}

} // namespace giantt
