/**
 * @file graph_doctor.hpp
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/graph/graph.hpp"

namespace giantt
{

// ============================================================================
// Issue types
// ============================================================================

/**
 * @brief Category of a structural problem in a graph.
 */
enum class IssueType
{
    DanglingReference,  ///< A relation names an id with no item.
    IncompleteChain     ///< A REQUIRES/BLOCKS or ANYOF/SUFFICIENT pair is one-sided.
};

const char* issue_type_name(IssueType type) noexcept;

/**
 * @brief One problem found by `GraphDoctor`.
 *
 * @details
 * For a dangling reference, `relation` is the bucket on `item_id` that names
 * the absent `related_id`. For an incomplete chain, `relation` is the bucket
 * on `item_id` whose mirror is missing on `related_id`.
 */
struct Issue
{
    IssueType type;
    std::string item_id;
    RelationType relation;
    std::string related_id;
    std::string message;

    bool operator==(const Issue& other) const
    {
        return type == other.type && item_id == other.item_id && relation == other.relation &&
            related_id == other.related_id && message == other.message;
    }
};

/**
 * @brief Restricts which issues `GraphDoctor::fix_issues()` acts on.
 */
struct IssueFilter
{
    std::optional<IssueType> type;
    std::optional<std::string> item_id;

    bool matches(const Issue& issue) const
    {
        return (!type || issue.type == *type) && (!item_id || issue.item_id == *item_id);
    }
};

// ============================================================================
// GraphDoctor
// ============================================================================

/**
 * @brief Finds and repairs structural problems in a graph.
 *
 * @details
 * Problems are reported as data, never thrown. Two kinds are detected:
 * - **Dangling references**: one issue per relation target that is not an
 *   item of the graph.
 * - **Incomplete chains**: one issue per `Requires`, `Blocks`, `AnyOf` or
 *   `Sufficient` edge whose existing target lacks the mirrored edge back.
 *
 * Only dangling references are fixed automatically, by deleting the target
 * from the bucket. Which side of an incomplete chain is authoritative cannot
 * be decided, so those are left to the user.
 *
 * The doctor holds a reference to the graph; the graph must outlive it.
 */
class GraphDoctor
{
public:
    explicit GraphDoctor(Graph& graph)
        : m_graph(graph)
    {
    }

    /**
     * @brief Scan the whole graph, O(V+E).
     */
    std::vector<Issue> full_diagnosis() const;

    /**
     * @brief Number of issues `full_diagnosis()` would report, without
     * building them.
     */
    size_t quick_check() const;

    /**
     * @brief Fix every dangling reference selected by `filter`.
     * @return Exactly the issues that were resolved.
     */
    std::vector<Issue> fix_issues(const IssueFilter& filter = {});

    /**
     * @brief The issues `fix_issues(filter)` would resolve, without changing
     * the graph.
     */
    std::vector<Issue> plan_fixes(const IssueFilter& filter = {}) const;

private:
    Graph& m_graph;
};

/**
 * @brief Select the issues of one type.
 */
std::vector<Issue> issues_by_type(const std::vector<Issue>& issues, IssueType type);

} // namespace giantt
