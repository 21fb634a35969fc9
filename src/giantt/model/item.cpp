/**
 * @file item.cpp
 */
#include "giantt/model/item.hpp"

namespace giantt
{

// ============================================================================
// Relation bucket helpers
// ============================================================================

bool add_target(Relations& relations, RelationType type, const std::string& target)
{
    auto& bucket = relations[type];
    if (std::find(bucket.begin(), bucket.end(), target) != bucket.end())
    {
        return false;
    }
    bucket.push_back(target);
    return true;
}

bool remove_target(Relations& relations, RelationType type, const std::string& target)
{
    auto it = relations.find(type);
    if (it == relations.end())
    {
        return false;
    }
    auto& bucket = it->second;
    auto pos = std::find(bucket.begin(), bucket.end(), target);
    if (pos == bucket.end())
    {
        return false;
    }
    bucket.erase(pos);
    if (bucket.empty())
    {
        relations.erase(it);
    }
    return true;
}

bool has_target(const Relations& relations, RelationType type, const std::string& target)
{
    auto it = relations.find(type);
    if (it == relations.end())
    {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), target) != it->second.end();
}

// ============================================================================
// Item
// ============================================================================

const std::vector<std::string>& Item::targets(RelationType type) const
{
    static const std::vector<std::string> k_none;
    auto it = relations.find(type);
    return it == relations.end() ? k_none : it->second;
}

bool Item::has_tag(const std::string& tag) const
{
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

Item Item::with_status(Status new_status) const
{
    Item copy = *this;
    copy.status = new_status;
    return copy;
}

Item Item::with_priority(Priority new_priority) const
{
    Item copy = *this;
    copy.priority = new_priority;
    return copy;
}

Item Item::with_title(std::string new_title) const
{
    Item copy = *this;
    copy.title = std::move(new_title);
    return copy;
}

Item Item::with_relations(Relations new_relations) const
{
    Item copy = *this;
    copy.relations = std::move(new_relations);
    return copy;
}

Item Item::with_occlude(bool new_occlude) const
{
    Item copy = *this;
    copy.occlude = new_occlude;
    return copy;
}

bool Item::operator==(const Item& other) const
{
    return id == other.id && title == other.title && description == other.description &&
        status == other.status && priority == other.priority && duration == other.duration &&
        charts == other.charts && tags == other.tags && relations == other.relations &&
        time_constraints == other.time_constraints && user_comment == other.user_comment &&
        auto_comment == other.auto_comment && occlude == other.occlude;
}

} // namespace giantt
