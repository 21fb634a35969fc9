/**
 * @file time_constraint.hpp
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/model/duration.hpp"
#include "giantt/model/enums.hpp"

namespace giantt
{

/**
 * @brief What happens when a time constraint is missed.
 */
enum class ConsequenceKind
{
    Severe,     ///< `severe`
    Warn,       ///< `warn`
    Escalating  ///< `escalate:<rate>`
};

/**
 * @brief Consequence of missing a time constraint.
 *
 * @details
 * `rate` is only meaningful for `Escalating` and uses the priority glyph scale
 * (`escalate:!!` escalates at `High`). It is kept at `Neutral` otherwise.
 */
struct Consequence
{
    ConsequenceKind kind{ConsequenceKind::Warn};
    Priority rate{Priority::Neutral};

    std::string to_string() const;

    bool operator==(const Consequence& other) const noexcept
    {
        return kind == other.kind && rate == other.rate;
    }

    bool operator!=(const Consequence& other) const noexcept
    {
        return !(*this == other);
    }
};

/**
 * @brief The item must be completed within `duration` of being started.
 */
struct WindowConstraint
{
    Duration duration;
    std::optional<Duration> grace;

    bool operator==(const WindowConstraint& other) const
    {
        return duration == other.duration && grace == other.grace;
    }
};

/**
 * @brief The item is due on a calendar date (`YYYY-MM-DD`).
 */
struct DeadlineConstraint
{
    std::string due_date;
    std::optional<Duration> grace;

    bool operator==(const DeadlineConstraint& other) const
    {
        return due_date == other.due_date && grace == other.grace;
    }
};

/**
 * @brief The item recurs every `interval`.
 *
 * @details
 * When `stack` is set, missed occurrences accumulate instead of being replaced
 * by the next one.
 */
struct RecurringConstraint
{
    Duration interval;
    std::optional<Duration> grace;
    bool stack{false};

    bool operator==(const RecurringConstraint& other) const
    {
        return interval == other.interval && grace == other.grace && stack == other.stack;
    }
};

/**
 * @brief A scheduling annotation attached to an item after `@@@`.
 *
 * @par Notation
 * - `window(D[:G],cons)`
 * - `due(YYYY-MM-DD[:G],cons)`
 * - `every(D[:G],cons[,stack])`
 */
struct TimeConstraint
{
    std::variant<WindowConstraint, DeadlineConstraint, RecurringConstraint> schedule;
    Consequence consequence;

    /**
     * @brief Grace period of whichever schedule this constraint holds.
     */
    const std::optional<Duration>& grace() const noexcept;

    std::string to_string() const;

    bool operator==(const TimeConstraint& other) const
    {
        return schedule == other.schedule && consequence == other.consequence;
    }

    bool operator!=(const TimeConstraint& other) const
    {
        return !(*this == other);
    }
};

} // namespace giantt
