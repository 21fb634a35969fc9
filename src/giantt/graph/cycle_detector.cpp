/**
 * @file cycle_detector.cpp
 */
#include "giantt/graph/cycle_detector.hpp"

#include <unordered_map>

namespace giantt
{

namespace
{

enum class Color
{
    White,
    Gray,
    Black
};

struct Frame
{
    const std::string* node;
    const std::vector<std::string>* successors;
    size_t next;
};

} // namespace

std::vector<std::string> strict_targets(const Item& item, const ItemExists& exists)
{
    std::vector<std::string> targets;
    for (RelationType type : {RelationType::Requires, RelationType::AnyOf})
    {
        for (const auto& target : item.targets(type))
        {
            if (exists(target) && std::find(targets.begin(), targets.end(), target) == targets.end())
            {
                targets.push_back(target);
            }
        }
    }
    return targets;
}

StrictAdjacency build_strict_adjacency(
    const std::map<std::string, Item>& items,
    const ItemExists& exists)
{
    ItemExists known = exists;
    if (!known)
    {
        known = [&items](const std::string& id) { return items.count(id) != 0; };
    }
    StrictAdjacency adjacency;
    for (const auto& [id, item] : items)
    {
        adjacency.emplace(id, strict_targets(item, known));
    }
    return adjacency;
}

std::optional<std::vector<std::string>> find_cycle(
    const StrictAdjacency& adjacency,
    const std::set<std::string>* within)
{
    static const std::vector<std::string> k_no_successors;

    auto included = [within](const std::string& id) {
        return within == nullptr || within->count(id) != 0;
    };
    auto successors_of = [&adjacency](const std::string& id) -> const std::vector<std::string>* {
        auto it = adjacency.find(id);
        return it == adjacency.end() ? &k_no_successors : &it->second;
    };

    std::unordered_map<std::string, Color> colors;
    std::unordered_map<std::string, size_t> path_index;
    std::vector<std::string> path;
    std::vector<Frame> stack;

    for (const auto& [root, root_successors] : adjacency)
    {
        if (!included(root) || colors[root] != Color::White)
        {
            continue;
        }
        colors[root] = Color::Gray;
        path_index[root] = path.size();
        path.push_back(root);
        stack.push_back(Frame{&root, &root_successors, 0});

        while (!stack.empty())
        {
            Frame& frame = stack.back();
            if (frame.next < frame.successors->size())
            {
                const std::string& next = (*frame.successors)[frame.next++];
                if (!included(next))
                {
                    continue;
                }
                Color& color = colors[next];
                if (color == Color::Gray)
                {
                    std::vector<std::string> cycle(
                        path.begin() + static_cast<std::ptrdiff_t>(path_index[next]), path.end());
                    cycle.push_back(next);
                    return cycle;
                }
                if (color == Color::White)
                {
                    color = Color::Gray;
                    path_index[next] = path.size();
                    path.push_back(next);
                    stack.push_back(Frame{&next, successors_of(next), 0});
                }
                continue;
            }
            colors[*frame.node] = Color::Black;
            path_index.erase(*frame.node);
            path.pop_back();
            stack.pop_back();
        }
    }
    return std::nullopt;
}

} // namespace giantt
