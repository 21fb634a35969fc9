/**
 * @file time_constraint.cpp
 */
#include "giantt/model/time_constraint.hpp"

namespace giantt
{

namespace
{

std::string with_grace(const Duration& base, const std::optional<Duration>& grace)
{
    std::string text = base.to_string();
    if (grace)
    {
        text += ':';
        text += grace->to_string();
    }
    return text;
}

} // namespace

std::string Consequence::to_string() const
{
    switch (kind)
    {
    case ConsequenceKind::Severe:
        return "severe";
    case ConsequenceKind::Warn:
        return "warn";
    case ConsequenceKind::Escalating:
        return std::string("escalate:") + priority_symbol(rate);
    }
    return "warn";
}

const std::optional<Duration>& TimeConstraint::grace() const noexcept
{
    return std::visit(
        [](const auto& s) -> const std::optional<Duration>& { return s.grace; }, schedule);
}

std::string TimeConstraint::to_string() const
{
    if (const auto* window = std::get_if<WindowConstraint>(&schedule))
    {
        return "window(" + with_grace(window->duration, window->grace) + "," +
            consequence.to_string() + ")";
    }
    if (const auto* deadline = std::get_if<DeadlineConstraint>(&schedule))
    {
        std::string text = "due(" + deadline->due_date;
        if (deadline->grace)
        {
            text += ':';
            text += deadline->grace->to_string();
        }
        return text + "," + consequence.to_string() + ")";
    }
    const auto& recurring = std::get<RecurringConstraint>(schedule);
    std::string text = "every(" + with_grace(recurring.interval, recurring.grace) + "," +
        consequence.to_string();
    if (recurring.stack)
    {
        text += ",stack";
    }
    return text + ")";
}

} // namespace giantt
