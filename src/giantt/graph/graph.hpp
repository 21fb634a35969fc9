/**
 * @file graph.hpp
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/model/item.hpp"

namespace giantt
{

/**
 * @brief Outcome of an occlude or include request.
 */
struct OccludeResult
{
    /// Ids whose flag was (or, for a dry run, would be) flipped.
    std::vector<std::string> changed;

    /// Ids that already had the requested flag.
    std::vector<std::string> unchanged;

    /// Requested ids with no item in the graph.
    std::vector<std::string> not_found;

    bool dry_run{false};
};

/**
 * @brief The item dependency graph.
 *
 * @details
 * `Graph` owns a map of items keyed by id and keeps the following
 * invariants through its own mutation methods:
 * - Item ids are unique.
 * - The subgraph of strict edges (`Requires`, `AnyOf`) reachable through
 *   `add_relation()` and `insert_between()` stays acyclic. A call that would
 *   close a cycle throws `CycleDetected` and leaves the graph unchanged.
 * - Mirrored relations are kept in sync: adding `a ⊢ b` also records `b ► a`,
 *   and removing either side removes both.
 *
 * Dangling targets (ids with no item) and one-sided relation pairs are
 * tolerated, since items can be added and removed independently of the items
 * referring to them. `GraphDoctor` reports them.
 *
 * @par Validate before commit
 * Mutations build the prospective strict adjacency on a scratch copy, search
 * it for a cycle, and only then write the changed items back.
 *
 * @par Value semantics
 * A graph is a value. `copy()` and `operator+` return new graphs and never
 * modify their operands.
 *
 * @par Thread safety
 * No internal synchronization. Concurrent reads are safe.
 */
class Graph
{
public:
    using ItemMap = std::map<std::string, Item>;

    Graph() = default;

    // ========================================================================
    // Queries
    // ========================================================================

    const ItemMap& items() const noexcept
    {
        return m_items;
    }

    size_t size() const noexcept
    {
        return m_items.size();
    }

    bool empty() const noexcept
    {
        return m_items.empty();
    }

    bool contains(const std::string& id) const
    {
        return m_items.count(id) != 0;
    }

    /**
     * @brief Look up an item.
     * @return Pointer to the item, or nullptr if absent.
     */
    const Item* find(const std::string& id) const;

    /**
     * @brief Look up an item that must exist.
     * @throw GraphOperationError (ItemNotFound) if absent.
     */
    const Item& at(const std::string& id) const;

    /**
     * @brief Find the single item matching a search string.
     *
     * @details
     * An item matches when its id equals `text` or its title contains `text`,
     * both compared case-insensitively.
     *
     * @throw GraphOperationError (NoMatch) if nothing matches.
     * @throw GraphOperationError (AmbiguousMatch) listing the matching ids if
     * more than one item matches.
     */
    const Item& find_by_substring(const std::string& text) const;

    std::vector<Item> included_items() const;
    std::vector<Item> occluded_items() const;

    // ========================================================================
    // Item mutation
    // ========================================================================

    /**
     * @brief Insert or replace an item by id.
     *
     * @details
     * The item is stored as given; relations it names are not mirrored onto
     * other items.
     */
    void add_item(Item item);

    /**
     * @brief Remove an item.
     *
     * @param id The item to remove.
     * @param cascade If true, also remove `id` from every other item's
     * relation buckets, erasing buckets that become empty.
     * @return True if the item existed.
     */
    bool remove_item(const std::string& id, bool cascade = false);

    // ========================================================================
    // Relation mutation
    // ========================================================================

    /**
     * @brief Add `from -type-> to` and its mirror `to -mirror(type)-> from`.
     *
     * @throw GraphOperationError (ItemNotFound) if either item is absent.
     * @throw CycleDetected if the new strict edge would close a cycle; the
     * graph is left unchanged.
     */
    void add_relation(const std::string& from, RelationType type, const std::string& to);

    /**
     * @brief Remove `from -type-> to` and its mirror.
     *
     * @details
     * Emptied buckets are erased. Absent items or edges are not an error.
     *
     * @return True if anything was removed.
     */
    bool remove_relation(const std::string& from, RelationType type, const std::string& to);

    /**
     * @brief Insert `new_item` into the chain `before ⊢ after`.
     *
     * @details
     * Afterwards `before ⊢ new_item ⊢ after`:
     * - `new_item` requires exactly `after_id` and blocks `before_id`.
     * - `before_id`'s requirement on `after_id` is replaced by `new_item`
     *   (the requirement is added if there was none).
     * - `after_id`'s block on `before_id` is replaced by `new_item`.
     *
     * @throw GraphOperationError (InvalidArgument) if both anchors are the
     * same item.
     * @throw GraphOperationError (ItemNotFound) if either anchor is absent.
     * @throw GraphOperationError (DuplicateItem) if `new_item.id` is taken.
     * @throw CycleDetected if the result would contain a cycle; no item is
     * changed.
     */
    void insert_between(Item new_item, const std::string& before_id, const std::string& after_id);

    // ========================================================================
    // Ordering
    // ========================================================================

    /**
     * @brief Items ordered so that every item follows its strict dependencies.
     *
     * @details
     * Kahn's algorithm over strict edges to existing items. Among items ready
     * at the same time, those with a smaller dependency depth (longest chain
     * of `Requires` edges below them) come first, then ascending id, so the
     * order is deterministic.
     *
     * @throw CycleDetected if the strict edges contain a cycle (possible when
     * items were added directly with cyclic relations).
     */
    std::vector<Item> topological_sort() const;

    /**
     * @brief Length of the longest `Requires` chain starting at `id`.
     *
     * @details
     * Only edges to existing items count. Edges leading back onto the chain
     * being measured are ignored, so the result is finite even on cyclic input.
     */
    size_t dependency_depth(const std::string& id) const;

    // ========================================================================
    // Occlusion
    // ========================================================================

    /**
     * @brief Mark items as occluded (archived).
     * @param dry_run If true, report what would change without changing it.
     */
    OccludeResult occlude_items(const std::vector<std::string>& ids, bool dry_run = false);

    /**
     * @brief Clear the occluded mark of items.
     * @param dry_run If true, report what would change without changing it.
     */
    OccludeResult include_items(const std::vector<std::string>& ids, bool dry_run = false);

    /**
     * @brief Occlude every included item carrying any of `tags`.
     * @param dry_run If true, report what would change without changing it.
     */
    OccludeResult occlude_items_by_tags(const std::vector<std::string>& tags, bool dry_run = false);

    // ========================================================================
    // Copy and merge
    // ========================================================================

    Graph copy() const
    {
        return *this;
    }

    /**
     * @brief Merge two graphs; on an id collision the right-hand item wins.
     */
    Graph operator+(const Graph& other) const;

private:
    void commit_if_acyclic(std::vector<Item> updated);

    OccludeResult set_occlude(const std::vector<std::string>& ids, bool occlude, bool dry_run);

    ItemMap m_items;
};

} // namespace giantt
