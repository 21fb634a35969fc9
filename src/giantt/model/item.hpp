/**
 * @file item.hpp
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/model/duration.hpp"
#include "giantt/model/enums.hpp"
#include "giantt/model/time_constraint.hpp"

namespace giantt
{

/**
 * @brief Relation buckets of an item: relation type to ordered target ids.
 *
 * @details
 * A bucket that becomes empty is erased, so a present key always maps to at
 * least one target. Keys iterate in canonical relation order.
 */
using Relations = std::map<RelationType, std::vector<std::string>>;

/**
 * @brief Append `target` to the `type` bucket unless already present.
 * @return True if the bucket changed.
 */
bool add_target(Relations& relations, RelationType type, const std::string& target);

/**
 * @brief Remove `target` from the `type` bucket, erasing the bucket if emptied.
 * @return True if the bucket changed.
 */
bool remove_target(Relations& relations, RelationType type, const std::string& target);

/**
 * @brief Check whether the `type` bucket contains `target`.
 */
bool has_target(const Relations& relations, RelationType type, const std::string& target);

/**
 * @brief A task node of the dependency graph.
 *
 * @details
 * `Item` is a plain value. Its identity is `id`; every other field is replaced
 * by copying, either directly or through the `with_*` helpers which return a
 * modified copy. Relation buckets should be mutated through `Graph`, which
 * keeps mirrored relations in sync on both items.
 *
 * `description` is held in memory only; it has no place in the line notation.
 * Comments are stored trimmed and on one line, and `user_comment` never
 * contains `###`; `serialize_item` refuses comments outside those limits.
 */
struct Item
{
    std::string id;
    std::string title;
    std::string description;
    Status status{Status::NotStarted};
    Priority priority{Priority::Neutral};
    Duration duration;
    std::vector<std::string> charts;
    std::vector<std::string> tags;
    Relations relations;
    std::vector<TimeConstraint> time_constraints;
    std::optional<std::string> user_comment;
    std::optional<std::string> auto_comment;
    bool occlude{false};

    /**
     * @brief Targets of one relation bucket, empty if the bucket is absent.
     */
    const std::vector<std::string>& targets(RelationType type) const;

    bool has_tag(const std::string& tag) const;

    Item with_status(Status new_status) const;
    Item with_priority(Priority new_priority) const;
    Item with_title(std::string new_title) const;
    Item with_relations(Relations new_relations) const;
    Item with_occlude(bool new_occlude) const;

    bool operator==(const Item& other) const;

    bool operator!=(const Item& other) const
    {
        return !(*this == other);
    }
};

} // namespace giantt
