/**
 * @file item_tests.cpp
 * @brief Unit tests for Item and its relation buckets.
 */
#include <gtest/gtest.h>
#include "giantt/model/item.hpp"
#include "test_support.hpp"

using namespace giantt;
using giantt_test::make_item;

// ============================================================================
// Relation Bucket Tests
// ============================================================================

TEST(RelationBucketTests, AddTarget_IgnoresDuplicates)
{
    Relations relations;
    EXPECT_TRUE(add_target(relations, RelationType::Requires, "a"));
    EXPECT_FALSE(add_target(relations, RelationType::Requires, "a"));
    EXPECT_TRUE(add_target(relations, RelationType::Requires, "b"));
    EXPECT_EQ(relations[RelationType::Requires], (std::vector<std::string>{"a", "b"}));
}

TEST(RelationBucketTests, RemoveTarget_DropsEmptiedBucket)
{
    Relations relations;
    add_target(relations, RelationType::Blocks, "x");
    EXPECT_TRUE(remove_target(relations, RelationType::Blocks, "x"));
    EXPECT_EQ(relations.count(RelationType::Blocks), 0u);
    EXPECT_FALSE(remove_target(relations, RelationType::Blocks, "x"));
}

TEST(RelationBucketTests, HasTarget_MissingBucket)
{
    Relations relations;
    EXPECT_FALSE(has_target(relations, RelationType::AnyOf, "x"));
    add_target(relations, RelationType::AnyOf, "x");
    EXPECT_TRUE(has_target(relations, RelationType::AnyOf, "x"));
    EXPECT_FALSE(has_target(relations, RelationType::Sufficient, "x"));
}

// ============================================================================
// Item Tests
// ============================================================================

TEST(ItemTests, Targets_EmptyForAbsentBucket)
{
    Item item = make_item("a");
    EXPECT_TRUE(item.targets(RelationType::Requires).empty());
    add_target(item.relations, RelationType::Requires, "b");
    EXPECT_EQ(item.targets(RelationType::Requires).size(), 1u);
}

TEST(ItemTests, WithStatus_LeavesOriginalUntouched)
{
    Item item = make_item("a");
    Item done = item.with_status(Status::Completed);
    EXPECT_EQ(item.status, Status::NotStarted);
    EXPECT_EQ(done.status, Status::Completed);
    EXPECT_EQ(done.id, "a");
}

TEST(ItemTests, WithHelpers_ReplaceOneField)
{
    Item item = make_item("a", "Old");
    EXPECT_EQ(item.with_title("New").title, "New");
    EXPECT_EQ(item.with_priority(Priority::High).priority, Priority::High);
    EXPECT_TRUE(item.with_occlude(true).occlude);

    Relations relations;
    add_target(relations, RelationType::Together, "b");
    EXPECT_TRUE(has_target(item.with_relations(relations).relations, RelationType::Together, "b"));
}

TEST(ItemTests, Equality_ComparesEveryField)
{
    Item a = make_item("a");
    Item b = make_item("a");
    EXPECT_EQ(a, b);

    b.tags.push_back("work");
    EXPECT_NE(a, b);
    EXPECT_TRUE(b.has_tag("work"));

    Item c = make_item("a");
    c.user_comment = "";
    EXPECT_NE(a, c);
}
