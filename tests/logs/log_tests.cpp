/**
 * @file log_tests.cpp
 * @brief Unit tests for log serialization, collections and storage.
 */
#include <gtest/gtest.h>
#include "giantt/common/errors.hpp"
#include "giantt/logs/log_collection.hpp"
#include "giantt/logs/log_serializer.hpp"
#include "giantt/logs/log_store.hpp"
#include "giantt/storage/banner.hpp"
#include "test_support.hpp"

using namespace giantt;
using giantt_test::read_file;
using giantt_test::write_file;

namespace
{

LogEntry entry_at(const std::string& session, const std::string& when, const std::string& message,
    std::set<std::string> tags = {})
{
    LogEntry entry;
    entry.session = session;
    entry.timestamp = parse_timestamp(when);
    entry.message = message;
    entry.tags = std::move(tags);
    return entry;
}

std::vector<std::string> messages_of(const std::vector<LogEntry>& entries)
{
    std::vector<std::string> messages;
    for (const auto& entry : entries)
    {
        messages.push_back(entry.message);
    }
    return messages;
}

} // namespace

// ============================================================================
// Serializer Tests
// ============================================================================

TEST(LogSerializerTests, Serialize_CompactKeys)
{
    LogEntry entry = entry_at("s1", "2024-05-01T10:00:00Z", "started", {"b", "a"});
    entry.metadata["mood"] = "good";

    EXPECT_EQ(serialize_log_entry(entry),
        R"({"m":"started","meta":{"mood":"good"},"s":"s1","t":"2024-05-01T10:00:00.000Z","tags":["a","b"]})");
}

TEST(LogSerializerTests, Parse_RoundTripsEntry)
{
    LogEntry entry = entry_at("s1", "2024-05-01T10:00:00.250Z", "quote \" and ☕", {"x"});
    entry.metadata["k"] = "v";
    LogEntry parsed = parse_log_entry(serialize_log_entry(entry), true);
    EXPECT_TRUE(parsed.occlude);
    parsed.occlude = false;
    EXPECT_EQ(parsed, entry);
}

TEST(LogSerializerTests, Parse_OptionalFieldsMayBeAbsent)
{
    LogEntry entry = parse_log_entry(R"({"s":"s","t":"2024-01-01T00:00:00Z","m":"hi"})");
    EXPECT_TRUE(entry.tags.empty());
    EXPECT_TRUE(entry.metadata.empty());
}

TEST(LogSerializerTests, Parse_NonStringMetadataKeptAsJson)
{
    LogEntry entry = parse_log_entry(R"({"s":"s","t":"2024-01-01T00:00:00Z","m":"hi","meta":{"n":3}})");
    EXPECT_EQ(entry.metadata.at("n"), "3");
}

TEST(LogSerializerTests, Parse_Errors)
{
    EXPECT_THROW(parse_log_entry("not json"), ParseError);
    EXPECT_THROW(parse_log_entry("[1]"), ParseError);
    EXPECT_THROW(parse_log_entry(R"({"t":"2024-01-01T00:00:00Z","m":"hi"})"), ParseError);
    EXPECT_THROW(parse_log_entry(R"({"s":"s","t":"later","m":"hi"})"), ParseError);
    EXPECT_THROW(parse_log_entry(R"({"s":"s","t":"2024-01-01T00:00:00Z","m":"hi","tags":"x"})"),
        ParseError);
}

// ============================================================================
// Collection Tests
// ============================================================================

TEST(LogCollectionTests, Construct_SortsByTimestamp)
{
    LogCollection logs({
        entry_at("s", "2024-01-03T00:00:00Z", "third"),
        entry_at("s", "2024-01-01T00:00:00Z", "first"),
        entry_at("s", "2024-01-02T00:00:00Z", "second"),
    });
    EXPECT_EQ(messages_of(logs.entries()), (std::vector<std::string>{"first", "second", "third"}));

    logs.add(entry_at("s", "2024-01-02T12:00:00Z", "between"));
    EXPECT_EQ(logs.entries()[2].message, "between");
}

TEST(LogCollectionTests, Add_EqualTimestampsKeepInsertionOrder)
{
    LogCollection logs;
    logs.add(entry_at("s", "2024-01-01T00:00:00Z", "one"));
    logs.add(entry_at("s", "2024-01-01T00:00:00Z", "two"));
    EXPECT_EQ(messages_of(logs.entries()), (std::vector<std::string>{"one", "two"}));
}

TEST(LogCollectionTests, Create_AppendsNewestEntry)
{
    LogCollection logs({entry_at("s", "2000-01-01T00:00:00Z", "old")});
    const LogEntry& created = logs.create("today", "fresh", {"t"});
    EXPECT_EQ(created.message, "fresh");
    EXPECT_EQ(logs.entries().back().session, "today");
}

TEST(LogCollectionTests, Queries)
{
    LogCollection logs({
        entry_at("a", "2024-01-01T00:00:00Z", "Wrote the Parser", {"code"}),
        entry_at("b", "2024-01-02T00:00:00Z", "fixed tests", {"code", "test"}),
        entry_at("a", "2024-01-03T00:00:00Z", "lunch", {"life"}),
    });

    EXPECT_EQ(logs.by_session("a").size(), 2u);
    EXPECT_EQ(logs.with_tags({"test", "life"}).size(), 2u);
    EXPECT_EQ(logs.with_tags({"code", "test"}, true).size(), 1u);
    EXPECT_EQ(messages_of(logs.containing("parser")), (std::vector<std::string>{"Wrote the Parser"}));
    EXPECT_EQ(logs.between(parse_timestamp("2024-01-02T00:00:00Z"),
                  parse_timestamp("2024-01-03T00:00:00Z")).size(), 2u);
    EXPECT_EQ(logs.sessions(), (std::vector<std::string>{"a", "b"}));
}

TEST(LogCollectionTests, OccludeSessionsAndTags)
{
    LogCollection logs({
        entry_at("a", "2024-01-01T00:00:00Z", "one", {"x"}),
        entry_at("b", "2024-01-02T00:00:00Z", "two", {"y"}),
        entry_at("c", "2024-01-03T00:00:00Z", "three", {"y"}),
    });

    LogOccludeResult dry = logs.occlude_sessions({"a"}, true);
    EXPECT_TRUE(dry.dry_run);
    EXPECT_EQ(dry.occluded.size(), 1u);
    EXPECT_TRUE(logs.occluded_entries().empty());

    logs.occlude_sessions({"a"});
    EXPECT_EQ(logs.occluded_entries().size(), 1u);

    LogOccludeResult tagged = logs.occlude_tagged({"x", "y"});
    EXPECT_EQ(messages_of(tagged.occluded), (std::vector<std::string>{"two", "three"}));
    EXPECT_TRUE(logs.included_entries().empty());
}

TEST(LogCollectionTests, Merge_InterleavesByTime)
{
    LogCollection left({entry_at("s", "2024-01-01T00:00:00Z", "1"), entry_at("s", "2024-01-03T00:00:00Z", "3")});
    LogCollection right({entry_at("s", "2024-01-02T00:00:00Z", "2")});
    EXPECT_EQ(messages_of((left + right).entries()), (std::vector<std::string>{"1", "2", "3"}));
}

// ============================================================================
// Store Tests
// ============================================================================

class LogStoreTests : public giantt_test::TempDirTest
{
};

TEST_F(LogStoreTests, SaveAndLoad_SplitsByOcclude)
{
    LogCollection logs({
        entry_at("a", "2024-01-01T00:00:00Z", "kept"),
        entry_at("b", "2024-01-02T00:00:00Z", "archived"),
    });
    logs.occlude_sessions({"b"});

    const auto active = dir() / "logs.jsonl";
    const auto archive = dir() / "occlude" / "logs.jsonl";
    StorageConfig config;
    config.create_backups = false;
    save_logs(active, archive, logs, config);

    EXPECT_EQ(read_file(active).rfind(logs_banner(false), 0), 0u);
    EXPECT_EQ(read_file(active).find("archived"), std::string::npos);

    LogCollection reloaded = load_logs(active, archive);
    ASSERT_EQ(reloaded.size(), 2u);
    EXPECT_EQ(reloaded.entries(), logs.entries());
}

TEST_F(LogStoreTests, Load_MissingFileIsEmpty)
{
    EXPECT_TRUE(load_log_file(dir() / "none.jsonl", false).empty());
}

TEST_F(LogStoreTests, Load_InvalidLineSkippedUnlessStrict)
{
    const auto file = dir() / "logs.jsonl";
    write_file(file,
        "# banner\n"
        "{\"s\":\"a\",\"t\":\"2024-01-01T00:00:00Z\",\"m\":\"ok\"}\n"
        "\n"
        "{broken\n");

    EXPECT_EQ(load_log_file(file, false).size(), 1u);
    LoadConfig strict;
    strict.strict = true;
    EXPECT_THROW(load_log_file(file, false, strict), ParseError);
}
