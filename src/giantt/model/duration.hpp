/**
 * @file duration.hpp
 */
#pragma once
#include "giantt/common/common.hpp"

namespace giantt
{

/**
 * @brief Units a duration part may be expressed in.
 *
 * @details
 * Months and years are fixed-length approximations (30 and 365 days).
 */
enum class DurationUnit
{
    Seconds,  ///< `s`
    Minutes,  ///< `min`
    Hours,    ///< `h`
    Days,     ///< `d`
    Weeks,    ///< `w`
    Months,   ///< `mo`
    Years     ///< `y`
};

/**
 * @brief Canonical short symbol of a unit (`s`, `min`, `h`, `d`, `w`, `mo`, `y`).
 */
const char* unit_symbol(DurationUnit unit) noexcept;

/**
 * @brief Number of seconds in one unit.
 */
int64_t unit_seconds(DurationUnit unit) noexcept;

/**
 * @brief Resolve a unit symbol or one of its long aliases.
 *
 * @details
 * Accepts the canonical symbols plus `hr`, `hour(s)`, `minute(s)`, `day(s)`,
 * `week(s)`, `month(s)` and `year(s)`.
 */
std::optional<DurationUnit> unit_from_symbol(std::string_view symbol) noexcept;

/**
 * @brief One `<amount><unit>` term of a compound duration.
 */
struct DurationPart
{
    double amount{0.0};
    DurationUnit unit{DurationUnit::Seconds};

    bool operator==(const DurationPart& other) const noexcept
    {
        return amount == other.amount && unit == other.unit;
    }

    bool operator!=(const DurationPart& other) const noexcept
    {
        return !(*this == other);
    }
};

/**
 * @brief A compound duration such as `6mo8d3.5s`.
 *
 * @details
 * The value of a duration is the sum of its parts. Part order is kept so that
 * text written by hand is reproduced on save.
 *
 * @par Equality
 * Two durations compare equal when their totals in seconds are equal, so a
 * zero-part duration equals `0s` and `1h` equals `60min`.
 */
class Duration
{
public:
    Duration() = default;

    explicit Duration(std::vector<DurationPart> parts)
        : m_parts(std::move(parts))
    {
    }

    Duration(double amount, DurationUnit unit)
        : m_parts{DurationPart{amount, unit}}
    {
    }

    const std::vector<DurationPart>& parts() const noexcept
    {
        return m_parts;
    }

    bool empty() const noexcept
    {
        return m_parts.empty();
    }

    /**
     * @brief Sum of all parts in seconds.
     */
    double total_seconds() const noexcept;

    /**
     * @brief Notation form, e.g. `3mo`, `1h30min`, or `0s` for no parts.
     */
    std::string to_string() const;

    Duration operator+(const Duration& other) const;

    bool operator==(const Duration& other) const noexcept
    {
        return total_seconds() == other.total_seconds();
    }

    bool operator!=(const Duration& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const Duration& other) const noexcept
    {
        return total_seconds() < other.total_seconds();
    }

private:
    std::vector<DurationPart> m_parts;
};

/**
 * @brief Format a duration amount: whole numbers without a decimal point,
 * others in their shortest round-trip form.
 *
 * @details
 * The result is always positional (`0.00001`, `15000000000000000`), never
 * exponent notation, so `parse_duration` accepts it.
 */
std::string format_amount(double amount);

} // namespace giantt
