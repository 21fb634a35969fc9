/**
 * @file cycle_detector.hpp
 * @brief Strict-edge adjacency views and three-color cycle search.
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/model/item.hpp"

namespace giantt
{

/**
 * @brief Strict-edge adjacency: item id to the ids it strictly depends on.
 *
 * @details
 * Every item has an entry (possibly empty). Targets are unique per entry,
 * listed `Requires` first, then `AnyOf`, each in bucket order.
 */
using StrictAdjacency = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Predicate telling whether an id names an item.
 */
using ItemExists = std::function<bool(const std::string&)>;

/**
 * @brief Strict targets of one item that satisfy `exists`.
 */
std::vector<std::string> strict_targets(const Item& item, const ItemExists& exists);

/**
 * @brief Build the strict adjacency of a set of items.
 *
 * @details
 * Edges to ids for which `exists` is false (dangling references) are left out.
 * When `exists` is empty, an id exists if it is a key of `items`.
 */
StrictAdjacency build_strict_adjacency(
    const std::map<std::string, Item>& items,
    const ItemExists& exists = {});

/**
 * @brief Search for a cycle with a three-color depth-first search.
 *
 * @details
 * Nodes are white (unvisited), gray (on the current path) or black (done).
 * Reaching a gray node closes a cycle; the result is the current path sliced
 * from that node's position, followed by the node again, e.g.
 * `{"a", "b", "c", "a"}`. Roots are tried in ascending id order and the
 * search is iterative, so it runs in O(V+E) without deep recursion.
 *
 * @param adjacency The graph to search.
 * @param within If given, only nodes in this set (and edges between them) are
 * considered.
 * @return The first cycle found, or std::nullopt if the graph is acyclic.
 */
std::optional<std::vector<std::string>> find_cycle(
    const StrictAdjacency& adjacency,
    const std::set<std::string>* within = nullptr);

} // namespace giantt
