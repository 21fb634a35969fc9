/**
 * @file graph_doctor.cpp
 */
#include "giantt/doctor/graph_doctor.hpp"

namespace giantt
{

namespace
{

constexpr std::array<RelationType, 4> k_chained_types{
    RelationType::Requires,
    RelationType::Blocks,
    RelationType::AnyOf,
    RelationType::Sufficient,
};

bool is_chained(RelationType type)
{
    return std::find(k_chained_types.begin(), k_chained_types.end(), type) !=
        k_chained_types.end();
}

// Calls on_dangling(item, type, target) and on_incomplete(item, type, target)
// for every problem, in item id order then canonical relation order.
template <typename OnDangling, typename OnIncomplete>
void scan(const Graph& graph, OnDangling&& on_dangling, OnIncomplete&& on_incomplete)
{
    for (const auto& [id, item] : graph.items())
    {
        for (const auto& [type, targets] : item.relations)
        {
            for (const auto& target : targets)
            {
                const Item* other = graph.find(target);
                if (other == nullptr)
                {
                    on_dangling(item, type, target);
                }
                else if (is_chained(type) && !has_target(other->relations, mirror_of(type), id))
                {
                    on_incomplete(item, type, target);
                }
            }
        }
    }
}

} // namespace

const char* issue_type_name(IssueType type) noexcept
{
    switch (type)
    {
    case IssueType::DanglingReference:
        return "dangling_reference";
    case IssueType::IncompleteChain:
        return "incomplete_chain";
    }
    return "unknown";
}

std::vector<Issue> GraphDoctor::full_diagnosis() const
{
    std::vector<Issue> issues;
    scan(
        m_graph,
        [&issues](const Item& item, RelationType type, const std::string& target) {
            issues.push_back(Issue{
                IssueType::DanglingReference,
                item.id,
                type,
                target,
                "References non-existent item '" + target + "' in " + relation_info(type).name +
                    " relation"});
        },
        [&issues](const Item& item, RelationType type, const std::string& target) {
            const RelationType mirror = mirror_of(type);
            issues.push_back(Issue{
                IssueType::IncompleteChain,
                item.id,
                type,
                target,
                std::string(relation_info(type).name) + " '" + target + "' is not mirrored: '" +
                    target + "' has no " + relation_info(mirror).name + " entry for '" + item.id +
                    "'"});
        });
    return issues;
}

size_t GraphDoctor::quick_check() const
{
    size_t count = 0;
    auto counter = [&count](const Item&, RelationType, const std::string&) { ++count; };
    scan(m_graph, counter, counter);
    return count;
}

std::vector<Issue> GraphDoctor::plan_fixes(const IssueFilter& filter) const
{
    std::vector<Issue> fixable;
    for (auto& issue : full_diagnosis())
    {
        if (issue.type == IssueType::DanglingReference && filter.matches(issue))
        {
            fixable.push_back(std::move(issue));
        }
    }
    return fixable;
}

std::vector<Issue> GraphDoctor::fix_issues(const IssueFilter& filter)
{
    std::vector<Issue> planned = plan_fixes(filter);
    std::vector<Issue> fixed;
    for (auto& issue : planned)
    {
        const Item* item = m_graph.find(issue.item_id);
        if (item == nullptr)
        {
            continue;
        }
        Item updated = *item;
        if (remove_target(updated.relations, issue.relation, issue.related_id))
        {
            m_graph.add_item(std::move(updated));
            fixed.push_back(std::move(issue));
        }
    }
    return fixed;
}

std::vector<Issue> issues_by_type(const std::vector<Issue>& issues, IssueType type)
{
    std::vector<Issue> selected;
    std::copy_if(issues.begin(), issues.end(), std::back_inserter(selected),
        [type](const Issue& issue) { return issue.type == type; });
    return selected;
}

} // namespace giantt
