/**
 * @file enums.cpp
 */
#include "giantt/model/enums.hpp"

namespace giantt
{

namespace
{

struct StatusInfo
{
    Status status;
    const char* name;
    const char* symbol;
};

constexpr std::array<StatusInfo, 4> k_statuses{{
    {Status::NotStarted, "NOT_STARTED", "○"},
    {Status::InProgress, "IN_PROGRESS", "◑"},
    {Status::Blocked, "BLOCKED", "⊘"},
    {Status::Completed, "COMPLETED", "●"},
}};

struct PriorityInfo
{
    Priority priority;
    const char* name;
    const char* symbol;
};

constexpr std::array<PriorityInfo, 7> k_priorities{{
    {Priority::Lowest, "LOWEST", ",,,"},
    {Priority::Low, "LOW", "..."},
    {Priority::Neutral, "NEUTRAL", ""},
    {Priority::Unsure, "UNSURE", "?"},
    {Priority::Medium, "MEDIUM", "!"},
    {Priority::High, "HIGH", "!!"},
    {Priority::Critical, "CRITICAL", "!!!"},
}};

// Longest glyphs first so that "!!!" is not read as "!" followed by "!!".
constexpr std::array<Priority, 6> k_suffix_order{
    Priority::Critical,
    Priority::High,
    Priority::Medium,
    Priority::Unsure,
    Priority::Low,
    Priority::Lowest,
};

bool ends_with(std::string_view text, std::string_view suffix)
{
    return text.size() >= suffix.size() &&
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ============================================================================
// Status
// ============================================================================

const char* status_symbol(Status status) noexcept
{
    return k_statuses[static_cast<size_t>(status)].symbol;
}

const char* status_name(Status status) noexcept
{
    return k_statuses[static_cast<size_t>(status)].name;
}

std::optional<Status> status_from_symbol(std::string_view symbol) noexcept
{
    for (const auto& info : k_statuses)
    {
        if (symbol == info.symbol)
        {
            return info.status;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Priority
// ============================================================================

const char* priority_symbol(Priority priority) noexcept
{
    return k_priorities[static_cast<size_t>(priority)].symbol;
}

const char* priority_name(Priority priority) noexcept
{
    return k_priorities[static_cast<size_t>(priority)].name;
}

std::optional<Priority> priority_from_symbol(std::string_view symbol) noexcept
{
    for (const auto& info : k_priorities)
    {
        if (symbol == info.symbol)
        {
            return info.priority;
        }
    }
    return std::nullopt;
}

std::pair<std::string_view, Priority> split_priority_suffix(std::string_view token) noexcept
{
    for (Priority priority : k_suffix_order)
    {
        std::string_view glyph = priority_symbol(priority);
        if (ends_with(token, glyph))
        {
            return {token.substr(0, token.size() - glyph.size()), priority};
        }
    }
    return {token, Priority::Neutral};
}

// ============================================================================
// Relation types
// ============================================================================

std::optional<RelationType> relation_from_symbol(std::string_view symbol) noexcept
{
    for (const auto& info : k_relation_types)
    {
        if (symbol == info.symbol)
        {
            return info.type;
        }
    }
    return std::nullopt;
}

std::optional<RelationType> relation_from_name(std::string_view name) noexcept
{
    for (const auto& info : k_relation_types)
    {
        if (name == info.name)
        {
            return info.type;
        }
    }
    return std::nullopt;
}

} // namespace giantt
