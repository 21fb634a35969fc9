/**
 * @file enums.hpp
 * @brief Status, priority and relation type enumerations with their glyphs.
 */
#pragma once
#include "giantt/common/common.hpp"

namespace giantt
{

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Progress state of an item.
 */
enum class Status
{
    NotStarted,  ///< `○`
    InProgress,  ///< `◑`
    Blocked,     ///< `⊘`
    Completed    ///< `●`
};

/**
 * @brief Priority of an item, lowest to highest.
 *
 * @details
 * The same seven-level scale is reused as the escalation rate of a time
 * constraint consequence. `Neutral` is written as an empty glyph.
 */
enum class Priority
{
    Lowest,    ///< `,,,`
    Low,       ///< `...`
    Neutral,   ///< (empty)
    Unsure,    ///< `?`
    Medium,    ///< `!`
    High,      ///< `!!`
    Critical   ///< `!!!`
};

/**
 * @brief Kind of a directed relation between two items.
 *
 * @details
 * The enumerator order is the canonical order in which relation buckets are
 * serialized.
 *
 * @par Mirroring
 * Adding a relation also records its mirror on the target item:
 * - `Requires` and `Blocks` mirror each other.
 * - `AnyOf` and `Sufficient` mirror each other.
 * - `Supercharges`, `Indicates`, `Together` and `Conflicts` mirror to themselves.
 *
 * @par Strict edges
 * Only `Requires` and `AnyOf` are strict. Strict edges take part in cycle
 * detection and topological ordering; an item is ordered after every item it
 * strictly depends on.
 */
enum class RelationType
{
    Requires,      ///< `⊢`
    AnyOf,         ///< `⋲`
    Supercharges,  ///< `≫`
    Indicates,     ///< `∴`
    Together,      ///< `∪`
    Conflicts,     ///< `⊟`
    Blocks,        ///< `►`
    Sufficient     ///< `≻`
};

// ============================================================================
// Relation type table
// ============================================================================

/**
 * @brief Static properties of one relation type.
 */
struct RelationTypeInfo
{
    RelationType type;
    const char* name;
    const char* symbol;
    RelationType mirror;
    bool strict;
};

/**
 * @brief All relation type properties, indexed by the enumerator value.
 */
inline constexpr std::array<RelationTypeInfo, 8> k_relation_types{{
    {RelationType::Requires, "REQUIRES", "⊢", RelationType::Blocks, true},
    {RelationType::AnyOf, "ANYOF", "⋲", RelationType::Sufficient, true},
    {RelationType::Supercharges, "SUPERCHARGES", "≫", RelationType::Supercharges, false},
    {RelationType::Indicates, "INDICATES", "∴", RelationType::Indicates, false},
    {RelationType::Together, "TOGETHER", "∪", RelationType::Together, false},
    {RelationType::Conflicts, "CONFLICTS", "⊟", RelationType::Conflicts, false},
    {RelationType::Blocks, "BLOCKS", "►", RelationType::Requires, false},
    {RelationType::Sufficient, "SUFFICIENT", "≻", RelationType::AnyOf, false},
}};

namespace detail
{

constexpr bool relation_table_is_consistent()
{
    for (size_t i = 0; i < k_relation_types.size(); ++i)
    {
        const auto& info = k_relation_types[i];
        if (static_cast<size_t>(info.type) != i)
        {
            return false;
        }
        const auto& mirror = k_relation_types[static_cast<size_t>(info.mirror)];
        if (mirror.mirror != info.type)
        {
            return false;
        }
    }
    return true;
}

} // namespace detail

static_assert(detail::relation_table_is_consistent(),
    "relation table must be indexed by enumerator and mirrors must be involutive");

constexpr const RelationTypeInfo& relation_info(RelationType type)
{
    return k_relation_types[static_cast<size_t>(type)];
}

constexpr RelationType mirror_of(RelationType type)
{
    return relation_info(type).mirror;
}

constexpr bool is_strict(RelationType type)
{
    return relation_info(type).strict;
}

// ============================================================================
// Glyph and name conversion
// ============================================================================

const char* status_symbol(Status status) noexcept;
const char* status_name(Status status) noexcept;
std::optional<Status> status_from_symbol(std::string_view symbol) noexcept;

const char* priority_symbol(Priority priority) noexcept;
const char* priority_name(Priority priority) noexcept;

/**
 * @brief Look up a priority by its exact glyph (empty string is `Neutral`).
 */
std::optional<Priority> priority_from_symbol(std::string_view symbol) noexcept;

/**
 * @brief Split a trailing priority glyph off an identifier-like token.
 *
 * @details
 * Glyphs are tried longest first (`!!!`, `!!`, `!`, `?`, `...`, `,,,`), so
 * `task!!` yields `{"task", High}` and `task` yields `{"task", Neutral}`.
 */
std::pair<std::string_view, Priority> split_priority_suffix(std::string_view token) noexcept;

std::optional<RelationType> relation_from_symbol(std::string_view symbol) noexcept;
std::optional<RelationType> relation_from_name(std::string_view name) noexcept;

} // namespace giantt
