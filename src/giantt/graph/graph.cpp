/**
 * @file graph.cpp
 */
#include "giantt/graph/graph.hpp"
#include "giantt/common/errors.hpp"
#include "giantt/graph/cycle_detector.hpp"

#include <cctype>

namespace giantt
{

namespace
{

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

size_t depth_of(
    const Graph::ItemMap& items,
    const std::string& id,
    std::map<std::string, size_t>& memo,
    std::set<std::string>& on_path)
{
    auto known = memo.find(id);
    if (known != memo.end())
    {
        return known->second;
    }
    if (!on_path.insert(id).second)
    {
        return 0;
    }
    size_t depth = 0;
    auto it = items.find(id);
    if (it != items.end())
    {
        for (const auto& target : it->second.targets(RelationType::Requires))
        {
            if (items.count(target) != 0)
            {
                depth = std::max(depth, 1 + depth_of(items, target, memo, on_path));
            }
        }
    }
    on_path.erase(id);
    memo[id] = depth;
    return depth;
}

std::string item_not_found(const std::string& id)
{
    return "Item '" + id + "' not found";
}

} // namespace

// ============================================================================
// Queries
// ============================================================================

const Item* Graph::find(const std::string& id) const
{
    auto it = m_items.find(id);
    return it == m_items.end() ? nullptr : &it->second;
}

const Item& Graph::at(const std::string& id) const
{
    const Item* item = find(id);
    if (item == nullptr)
    {
        throw GraphOperationError(GianttErrorCode::ItemNotFound, item_not_found(id));
    }
    return *item;
}

const Item& Graph::find_by_substring(const std::string& text) const
{
    const std::string needle = to_lower(text);
    std::vector<const Item*> matches;
    for (const auto& [id, item] : m_items)
    {
        if (to_lower(id) == needle || to_lower(item.title).find(needle) != std::string::npos)
        {
            matches.push_back(&item);
        }
    }
    if (matches.empty())
    {
        throw GraphOperationError(
            GianttErrorCode::NoMatch, "No items found matching '" + text + "'");
    }
    if (matches.size() > 1)
    {
        std::string message = "Multiple items match '" + text + "':";
        for (const Item* match : matches)
        {
            message += ' ';
            message += match->id;
        }
        throw GraphOperationError(GianttErrorCode::AmbiguousMatch, message);
    }
    return *matches.front();
}

std::vector<Item> Graph::included_items() const
{
    std::vector<Item> result;
    for (const auto& [id, item] : m_items)
    {
        if (!item.occlude)
        {
            result.push_back(item);
        }
    }
    return result;
}

std::vector<Item> Graph::occluded_items() const
{
    std::vector<Item> result;
    for (const auto& [id, item] : m_items)
    {
        if (item.occlude)
        {
            result.push_back(item);
        }
    }
    return result;
}

// ============================================================================
// Item mutation
// ============================================================================

void Graph::add_item(Item item)
{
    std::string id = item.id;
    m_items[id] = std::move(item);
}

bool Graph::remove_item(const std::string& id, bool cascade)
{
    if (m_items.erase(id) == 0)
    {
        return false;
    }
    if (cascade)
    {
        for (auto& [other_id, item] : m_items)
        {
            for (auto it = item.relations.begin(); it != item.relations.end();)
            {
                auto& bucket = it->second;
                bucket.erase(std::remove(bucket.begin(), bucket.end(), id), bucket.end());
                it = bucket.empty() ? item.relations.erase(it) : std::next(it);
            }
        }
    }
    return true;
}

// ============================================================================
// Relation mutation
// ============================================================================

void Graph::commit_if_acyclic(std::vector<Item> updated)
{
    ItemExists exists = [this, &updated](const std::string& id) {
        if (m_items.count(id) != 0)
        {
            return true;
        }
        return std::any_of(updated.begin(), updated.end(),
            [&id](const Item& item) { return item.id == id; });
    };

    StrictAdjacency adjacency = build_strict_adjacency(m_items, exists);
    for (const auto& item : updated)
    {
        adjacency[item.id] = strict_targets(item, exists);
    }
    if (auto cycle = find_cycle(adjacency))
    {
        throw CycleDetected(std::move(*cycle));
    }

    for (auto& item : updated)
    {
        std::string id = item.id;
        m_items[id] = std::move(item);
    }
}

void Graph::add_relation(const std::string& from, RelationType type, const std::string& to)
{
    const Item& from_item = at(from);
    const Item& to_item = at(to);

    if (from == to)
    {
        Item self = from_item;
        add_target(self.relations, type, to);
        add_target(self.relations, mirror_of(type), from);
        commit_if_acyclic({std::move(self)});
        return;
    }

    Item new_from = from_item;
    Item new_to = to_item;
    add_target(new_from.relations, type, to);
    add_target(new_to.relations, mirror_of(type), from);
    commit_if_acyclic({std::move(new_from), std::move(new_to)});
}

bool Graph::remove_relation(const std::string& from, RelationType type, const std::string& to)
{
    auto from_it = m_items.find(from);
    auto to_it = m_items.find(to);
    if (from_it == m_items.end() || to_it == m_items.end())
    {
        return false;
    }
    bool changed = remove_target(from_it->second.relations, type, to);
    changed = remove_target(to_it->second.relations, mirror_of(type), from) || changed;
    return changed;
}

void Graph::insert_between(Item new_item, const std::string& before_id, const std::string& after_id)
{
    if (before_id == after_id)
    {
        throw GraphOperationError(GianttErrorCode::InvalidArgument,
            "Cannot insert '" + new_item.id + "' between '" + before_id + "' and itself");
    }
    Item before = at(before_id);
    Item after = at(after_id);
    if (contains(new_item.id))
    {
        throw GraphOperationError(
            GianttErrorCode::DuplicateItem, "Item '" + new_item.id + "' already exists");
    }

    new_item.relations[RelationType::Requires] = {after_id};
    add_target(new_item.relations, RelationType::Blocks, before_id);

    auto& before_requires = before.relations[RelationType::Requires];
    auto req_pos = std::find(before_requires.begin(), before_requires.end(), after_id);
    if (req_pos == before_requires.end())
    {
        add_target(before.relations, RelationType::Requires, new_item.id);
    }
    else if (has_target(before.relations, RelationType::Requires, new_item.id))
    {
        before_requires.erase(req_pos);
    }
    else
    {
        *req_pos = new_item.id;
    }

    auto& after_blocks = after.relations[RelationType::Blocks];
    auto block_pos = std::find(after_blocks.begin(), after_blocks.end(), before_id);
    if (block_pos == after_blocks.end())
    {
        add_target(after.relations, RelationType::Blocks, new_item.id);
    }
    else if (has_target(after.relations, RelationType::Blocks, new_item.id))
    {
        after_blocks.erase(block_pos);
    }
    else
    {
        *block_pos = new_item.id;
    }

    commit_if_acyclic({std::move(new_item), std::move(before), std::move(after)});
}

// ============================================================================
// Ordering
// ============================================================================

size_t Graph::dependency_depth(const std::string& id) const
{
    std::map<std::string, size_t> memo;
    std::set<std::string> on_path;
    return depth_of(m_items, id, memo, on_path);
}

std::vector<Item> Graph::topological_sort() const
{
    StrictAdjacency dependencies = build_strict_adjacency(m_items);

    std::map<std::string, size_t> in_degree;
    std::map<std::string, std::vector<std::string>> dependents;
    for (const auto& [id, targets] : dependencies)
    {
        in_degree[id] = targets.size();
        for (const auto& target : targets)
        {
            dependents[target].push_back(id);
        }
    }

    std::map<std::string, size_t> depth_memo;
    std::set<std::string> on_path;
    auto depth = [&](const std::string& id) { return depth_of(m_items, id, depth_memo, on_path); };

    // Ready items ordered by (dependency depth, id).
    std::set<std::pair<size_t, std::string>> ready;
    for (const auto& [id, degree] : in_degree)
    {
        if (degree == 0)
        {
            ready.emplace(depth(id), id);
        }
    }

    std::vector<Item> sorted;
    sorted.reserve(m_items.size());
    while (!ready.empty())
    {
        std::string id = ready.begin()->second;
        ready.erase(ready.begin());
        sorted.push_back(m_items.at(id));
        for (const auto& dependent : dependents[id])
        {
            if (--in_degree[dependent] == 0)
            {
                ready.emplace(depth(dependent), dependent);
            }
        }
    }

    if (sorted.size() != m_items.size())
    {
        std::set<std::string> unconsumed;
        for (const auto& [id, degree] : in_degree)
        {
            if (degree > 0)
            {
                unconsumed.insert(id);
            }
        }
        auto cycle = find_cycle(dependencies, &unconsumed);
        if (!cycle)
        {
            // Every unconsumed node lies on or behind a cycle, so the search
            // cannot come back empty; report the whole set if it somehow does.
            cycle = std::vector<std::string>(unconsumed.begin(), unconsumed.end());
            cycle->push_back(cycle->front());
        }
        throw CycleDetected(std::move(*cycle));
    }
    return sorted;
}

// ============================================================================
// Occlusion
// ============================================================================

OccludeResult Graph::set_occlude(const std::vector<std::string>& ids, bool occlude, bool dry_run)
{
    OccludeResult result;
    result.dry_run = dry_run;
    for (const auto& id : ids)
    {
        auto it = m_items.find(id);
        if (it == m_items.end())
        {
            result.not_found.push_back(id);
            continue;
        }
        if (it->second.occlude == occlude)
        {
            result.unchanged.push_back(id);
            continue;
        }
        result.changed.push_back(id);
        if (!dry_run)
        {
            it->second.occlude = occlude;
        }
    }
    return result;
}

OccludeResult Graph::occlude_items(const std::vector<std::string>& ids, bool dry_run)
{
    return set_occlude(ids, true, dry_run);
}

OccludeResult Graph::include_items(const std::vector<std::string>& ids, bool dry_run)
{
    return set_occlude(ids, false, dry_run);
}

OccludeResult Graph::occlude_items_by_tags(const std::vector<std::string>& tags, bool dry_run)
{
    std::vector<std::string> ids;
    for (const auto& [id, item] : m_items)
    {
        if (item.occlude)
        {
            continue;
        }
        if (std::any_of(tags.begin(), tags.end(),
                [&item](const std::string& tag) { return item.has_tag(tag); }))
        {
            ids.push_back(id);
        }
    }
    return set_occlude(ids, true, dry_run);
}

// ============================================================================
// Copy and merge
// ============================================================================

Graph Graph::operator+(const Graph& other) const
{
    Graph merged = *this;
    for (const auto& [id, item] : other.m_items)
    {
        merged.m_items[id] = item;
    }
    return merged;
}

} // namespace giantt
