/**
 * @file log_collection.hpp
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/model/log_entry.hpp"

namespace giantt
{

/**
 * @brief Outcome of an occlude request on a log collection.
 */
struct LogOccludeResult
{
    /// Entries that were (or, for a dry run, would be) occluded.
    std::vector<LogEntry> occluded;
    bool dry_run{false};
};

/**
 * @brief An ordered collection of log entries.
 *
 * @details
 * Entries are kept sorted by timestamp; entries with equal timestamps stay
 * in insertion order. Duplicates are allowed.
 */
class LogCollection
{
public:
    LogCollection() = default;

    explicit LogCollection(std::vector<LogEntry> entries);

    const std::vector<LogEntry>& entries() const noexcept
    {
        return m_entries;
    }

    size_t size() const noexcept
    {
        return m_entries.size();
    }

    bool empty() const noexcept
    {
        return m_entries.empty();
    }

    /**
     * @brief Insert an entry at its timestamp position.
     */
    void add(LogEntry entry);

    /**
     * @brief Create an entry stamped now and insert it.
     * @return The inserted entry.
     */
    const LogEntry& create(
        std::string session,
        std::string message,
        std::set<std::string> tags = {},
        std::map<std::string, std::string> metadata = {});

    // ========================================================================
    // Queries
    // ========================================================================

    std::vector<LogEntry> by_session(const std::string& session) const;

    /**
     * @brief Entries carrying any of `tags` (or all of them if `require_all`).
     */
    std::vector<LogEntry> with_tags(const std::vector<std::string>& tags, bool require_all = false) const;

    /**
     * @brief Entries whose message contains `text`, ignoring ASCII case.
     */
    std::vector<LogEntry> containing(const std::string& text) const;

    /**
     * @brief Entries with `from <= timestamp <= to`.
     */
    std::vector<LogEntry> between(Timestamp from, Timestamp to) const;

    /**
     * @brief Distinct session names in first-appearance order.
     */
    std::vector<std::string> sessions() const;

    std::vector<LogEntry> included_entries() const;
    std::vector<LogEntry> occluded_entries() const;

    // ========================================================================
    // Occlusion
    // ========================================================================

    /**
     * @brief Occlude every included entry of the given sessions.
     * @param dry_run If true, report without changing anything.
     */
    LogOccludeResult occlude_sessions(const std::vector<std::string>& sessions, bool dry_run = false);

    /**
     * @brief Occlude every included entry carrying any of `tags`.
     * @param dry_run If true, report without changing anything.
     */
    LogOccludeResult occlude_tagged(const std::vector<std::string>& tags, bool dry_run = false);

    /**
     * @brief Merge two collections, keeping timestamp order.
     */
    LogCollection operator+(const LogCollection& other) const;

private:
    LogOccludeResult occlude_if(const std::function<bool(const LogEntry&)>& pred, bool dry_run);

    std::vector<LogEntry> m_entries;
};

} // namespace giantt
