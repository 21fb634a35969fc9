/**
 * @file cycle_detector_tests.cpp
 * @brief Unit tests for strict-edge extraction and cycle search.
 */
#include <gtest/gtest.h>
#include "giantt/graph/cycle_detector.hpp"
#include "test_support.hpp"

using namespace giantt;
using giantt_test::make_item;

TEST(CycleDetectorTests, StrictTargets_RequiresThenAnyOfDeduplicated)
{
    Item item = make_item("a");
    add_target(item.relations, RelationType::Requires, "b");
    add_target(item.relations, RelationType::AnyOf, "c");
    add_target(item.relations, RelationType::AnyOf, "b");
    add_target(item.relations, RelationType::Blocks, "d");
    add_target(item.relations, RelationType::Supercharges, "e");

    auto all = [](const std::string&) { return true; };
    EXPECT_EQ(strict_targets(item, all), (std::vector<std::string>{"b", "c"}));
}

TEST(CycleDetectorTests, StrictTargets_SkipsMissingItems)
{
    Item item = make_item("a");
    add_target(item.relations, RelationType::Requires, "ghost");
    add_target(item.relations, RelationType::Requires, "b");
    auto only_b = [](const std::string& id) { return id == "b"; };
    EXPECT_EQ(strict_targets(item, only_b), (std::vector<std::string>{"b"}));
}

TEST(CycleDetectorTests, BuildAdjacency_DefaultsToGraphMembership)
{
    std::map<std::string, Item> items;
    Item a = make_item("a");
    add_target(a.relations, RelationType::Requires, "b");
    add_target(a.relations, RelationType::Requires, "missing");
    items["a"] = a;
    items["b"] = make_item("b");

    StrictAdjacency adj = build_strict_adjacency(items);
    EXPECT_EQ(adj.at("a"), (std::vector<std::string>{"b"}));
    EXPECT_TRUE(adj.at("b").empty());
}

TEST(CycleDetectorTests, FindCycle_AcyclicReturnsNothing)
{
    StrictAdjacency adj{{"a", {"b", "c"}}, {"b", {"c"}}, {"c", {}}};
    EXPECT_FALSE(find_cycle(adj).has_value());
}

TEST(CycleDetectorTests, FindCycle_ReturnsClosedPath)
{
    StrictAdjacency adj{{"a", {"b"}}, {"b", {"c"}}, {"c", {"a"}}, {"d", {"a"}}};
    auto cycle = find_cycle(adj);
    ASSERT_TRUE(cycle.has_value());
    ASSERT_EQ(cycle->size(), 4u);
    EXPECT_EQ(cycle->front(), cycle->back());
    EXPECT_EQ(*cycle, (std::vector<std::string>{"a", "b", "c", "a"}));
}

TEST(CycleDetectorTests, FindCycle_SelfLoop)
{
    StrictAdjacency adj{{"a", {"a"}}};
    auto cycle = find_cycle(adj);
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(*cycle, (std::vector<std::string>{"a", "a"}));
}

TEST(CycleDetectorTests, FindCycle_RestrictedToSubset)
{
    StrictAdjacency adj{{"a", {"b"}}, {"b", {"a"}}, {"c", {"d"}}, {"d", {"c"}}};
    std::set<std::string> within{"c", "d"};
    auto cycle = find_cycle(adj, &within);
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(*cycle, (std::vector<std::string>{"c", "d", "c"}));
}

TEST(CycleDetectorTests, FindCycle_DeepChainDoesNotRecurse)
{
    StrictAdjacency adj;
    const int n = 20000;
    for (int i = 0; i < n; ++i)
    {
        adj["n" + std::to_string(i)] = {"n" + std::to_string(i + 1)};
    }
    adj["n" + std::to_string(n)] = {};
    EXPECT_FALSE(find_cycle(adj).has_value());

    adj["n" + std::to_string(n)] = {"n0"};
    auto cycle = find_cycle(adj);
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(cycle->size(), static_cast<size_t>(n + 2));
}
