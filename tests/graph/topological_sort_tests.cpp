/**
 * @file topological_sort_tests.cpp
 * @brief Unit tests for Graph::topological_sort() and dependency depth.
 */
#include <gtest/gtest.h>
#include "giantt/common/errors.hpp"
#include "giantt/graph/graph.hpp"
#include "test_support.hpp"

using namespace giantt;
using giantt_test::make_item;

namespace
{

std::vector<std::string> ids_of(const std::vector<Item>& items)
{
    std::vector<std::string> ids;
    for (const auto& item : items)
    {
        ids.push_back(item.id);
    }
    return ids;
}

Item requiring(const std::string& id, std::vector<std::string> targets)
{
    Item item = make_item(id);
    for (const auto& target : targets)
    {
        add_target(item.relations, RelationType::Requires, target);
    }
    return item;
}

} // namespace

TEST(TopologicalSortTests, Chain_DependenciesFirst)
{
    Graph graph;
    graph.add_item(make_item("A"));
    graph.add_item(make_item("B"));
    graph.add_item(make_item("C"));
    graph.add_relation("A", RelationType::Requires, "B");
    graph.add_relation("B", RelationType::Requires, "C");

    EXPECT_EQ(ids_of(graph.topological_sort()), (std::vector<std::string>{"C", "B", "A"}));
}

TEST(TopologicalSortTests, Empty_ReturnsEmpty)
{
    Graph graph;
    EXPECT_TRUE(graph.topological_sort().empty());
}

TEST(TopologicalSortTests, Ties_BrokenByDepthThenId)
{
    Graph graph;
    graph.add_item(make_item("z_root"));
    graph.add_item(make_item("a_root"));
    graph.add_item(requiring("m", {"z_root"}));
    graph.add_item(requiring("b", {"m"}));
    graph.add_item(make_item("c_free"));

    EXPECT_EQ(ids_of(graph.topological_sort()),
        (std::vector<std::string>{"a_root", "c_free", "z_root", "m", "b"}));
}

TEST(TopologicalSortTests, AnyOfOrdersLikeRequires)
{
    Graph graph;
    Item a = make_item("a");
    add_target(a.relations, RelationType::AnyOf, "b");
    graph.add_item(a);
    graph.add_item(make_item("b"));

    EXPECT_EQ(ids_of(graph.topological_sort()), (std::vector<std::string>{"b", "a"}));
}

TEST(TopologicalSortTests, DanglingTargetsIgnored)
{
    Graph graph;
    graph.add_item(requiring("a", {"ghost"}));
    EXPECT_EQ(ids_of(graph.topological_sort()), (std::vector<std::string>{"a"}));
}

TEST(TopologicalSortTests, Deterministic_AcrossInsertionOrder)
{
    Graph first;
    first.add_item(requiring("x", {"y"}));
    first.add_item(make_item("y"));
    first.add_item(make_item("w"));

    Graph second;
    second.add_item(make_item("w"));
    second.add_item(make_item("y"));
    second.add_item(requiring("x", {"y"}));

    EXPECT_EQ(ids_of(first.topological_sort()), ids_of(second.topological_sort()));
}

TEST(TopologicalSortTests, Cycle_ReportsClosedPath)
{
    // Items added directly bypass add_relation's cycle check.
    Graph graph;
    graph.add_item(requiring("a", {"b"}));
    graph.add_item(requiring("b", {"c"}));
    graph.add_item(requiring("c", {"a"}));
    graph.add_item(requiring("d", {"a"}));
    graph.add_item(make_item("e"));

    try
    {
        graph.topological_sort();
        FAIL() << "expected CycleDetected";
    }
    catch (const CycleDetected& e)
    {
        const auto& cycle = e.cycle();
        ASSERT_EQ(cycle.size(), 4u);
        EXPECT_EQ(cycle.front(), cycle.back());
        std::set<std::string> members(cycle.begin(), cycle.end());
        EXPECT_EQ(members, (std::set<std::string>{"a", "b", "c"}));
        EXPECT_NE(std::string(e.what()).find(" -> "), std::string::npos);
    }
}

TEST(TopologicalSortTests, DependencyDepth)
{
    Graph graph;
    graph.add_item(make_item("c"));
    graph.add_item(requiring("b", {"c"}));
    graph.add_item(requiring("a", {"b", "c"}));

    EXPECT_EQ(graph.dependency_depth("c"), 0u);
    EXPECT_EQ(graph.dependency_depth("b"), 1u);
    EXPECT_EQ(graph.dependency_depth("a"), 2u);
    EXPECT_EQ(graph.dependency_depth("missing"), 0u);
}
