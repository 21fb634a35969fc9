/**
 * @file graph_doctor_tests.cpp
 * @brief Unit tests for GraphDoctor diagnosis and repair.
 */
#include <gtest/gtest.h>
#include "giantt/doctor/graph_doctor.hpp"
#include "test_support.hpp"

using namespace giantt;
using giantt_test::make_item;

// ============================================================================
// Diagnosis Tests
// ============================================================================

TEST(GraphDoctorTests, Diagnosis_HealthyGraphHasNoIssues)
{
    Graph graph;
    graph.add_item(make_item("a"));
    graph.add_item(make_item("b"));
    graph.add_relation("a", RelationType::Requires, "b");
    graph.add_relation("a", RelationType::AnyOf, "b");

    GraphDoctor doctor(graph);
    EXPECT_TRUE(doctor.full_diagnosis().empty());
    EXPECT_EQ(doctor.quick_check(), 0u);
}

TEST(GraphDoctorTests, Diagnosis_DanglingReference)
{
    Graph graph;
    Item x = make_item("X");
    add_target(x.relations, RelationType::Requires, "missing");
    graph.add_item(x);

    GraphDoctor doctor(graph);
    auto issues = doctor.full_diagnosis();
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].type, IssueType::DanglingReference);
    EXPECT_EQ(issues[0].item_id, "X");
    EXPECT_EQ(issues[0].relation, RelationType::Requires);
    EXPECT_EQ(issues[0].related_id, "missing");
    EXPECT_EQ(issues[0].message, "References non-existent item 'missing' in REQUIRES relation");
    EXPECT_STREQ(issue_type_name(issues[0].type), "dangling_reference");
}

TEST(GraphDoctorTests, Diagnosis_IncompleteChainBothDirections)
{
    Graph graph;
    Item a = make_item("a");
    add_target(a.relations, RelationType::Requires, "b");
    Item c = make_item("c");
    add_target(c.relations, RelationType::Sufficient, "a");
    graph.add_item(a);
    graph.add_item(make_item("b"));
    graph.add_item(c);

    auto issues = GraphDoctor(graph).full_diagnosis();
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].type, IssueType::IncompleteChain);
    EXPECT_EQ(issues[0].item_id, "a");
    EXPECT_EQ(issues[0].relation, RelationType::Requires);
    EXPECT_EQ(issues[1].item_id, "c");
    EXPECT_EQ(issues[1].relation, RelationType::Sufficient);
    EXPECT_STREQ(issue_type_name(IssueType::IncompleteChain), "incomplete_chain");
}

TEST(GraphDoctorTests, Diagnosis_SymmetricTypesNotChained)
{
    Graph graph;
    Item a = make_item("a");
    add_target(a.relations, RelationType::Conflicts, "b");
    graph.add_item(a);
    graph.add_item(make_item("b"));
    EXPECT_TRUE(GraphDoctor(graph).full_diagnosis().empty());
}

TEST(GraphDoctorTests, QuickCheck_CountsEveryIssue)
{
    Graph graph;
    Item a = make_item("a");
    add_target(a.relations, RelationType::Requires, "ghost1");
    add_target(a.relations, RelationType::Blocks, "ghost2");
    add_target(a.relations, RelationType::Blocks, "b");
    graph.add_item(a);
    graph.add_item(make_item("b"));

    GraphDoctor doctor(graph);
    EXPECT_EQ(doctor.quick_check(), 3u);
    EXPECT_EQ(issues_by_type(doctor.full_diagnosis(), IssueType::DanglingReference).size(), 2u);
}

// ============================================================================
// Repair Tests
// ============================================================================

TEST(GraphDoctorTests, Fix_RemovesDanglingAndDropsEmptyBucket)
{
    Graph graph;
    Item x = make_item("X");
    add_target(x.relations, RelationType::Requires, "missing");
    graph.add_item(x);

    GraphDoctor doctor(graph);
    auto fixed = doctor.fix_issues();
    ASSERT_EQ(fixed.size(), 1u);
    EXPECT_EQ(fixed[0].related_id, "missing");
    EXPECT_EQ(graph.at("X").relations.count(RelationType::Requires), 0u);
    EXPECT_TRUE(doctor.full_diagnosis().empty());
}

TEST(GraphDoctorTests, Fix_LeavesIncompleteChainsAlone)
{
    Graph graph;
    Item a = make_item("a");
    add_target(a.relations, RelationType::Requires, "b");
    graph.add_item(a);
    graph.add_item(make_item("b"));

    GraphDoctor doctor(graph);
    EXPECT_TRUE(doctor.fix_issues().empty());
    EXPECT_EQ(doctor.quick_check(), 1u);
}

TEST(GraphDoctorTests, Fix_FilterByItem)
{
    Graph graph;
    Item a = make_item("a");
    add_target(a.relations, RelationType::Requires, "ghost");
    Item b = make_item("b");
    add_target(b.relations, RelationType::Together, "ghost");
    graph.add_item(a);
    graph.add_item(b);

    GraphDoctor doctor(graph);
    IssueFilter filter;
    filter.item_id = "b";

    auto planned = doctor.plan_fixes(filter);
    ASSERT_EQ(planned.size(), 1u);
    EXPECT_EQ(planned[0].item_id, "b");
    EXPECT_EQ(doctor.quick_check(), 2u);

    auto fixed = doctor.fix_issues(filter);
    ASSERT_EQ(fixed.size(), 1u);
    EXPECT_TRUE(graph.at("b").relations.empty());
    EXPECT_TRUE(has_target(graph.at("a").relations, RelationType::Requires, "ghost"));
}

TEST(GraphDoctorTests, Fix_FilterByType)
{
    Graph graph;
    Item a = make_item("a");
    add_target(a.relations, RelationType::Requires, "ghost");
    graph.add_item(a);

    IssueFilter filter;
    filter.type = IssueType::IncompleteChain;
    EXPECT_TRUE(GraphDoctor(graph).fix_issues(filter).empty());
    EXPECT_TRUE(has_target(graph.at("a").relations, RelationType::Requires, "ghost"));
}
