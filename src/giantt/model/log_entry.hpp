/**
 * @file log_entry.hpp
 */
#pragma once
#include "giantt/common/common.hpp"

namespace giantt
{

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Format a timestamp as ISO-8601 UTC with milliseconds,
 * e.g. `2024-03-01T09:30:00.250Z`.
 */
std::string format_timestamp(Timestamp timestamp);

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * @details
 * Accepts `YYYY-MM-DDTHH:MM:SS` with optional fractional seconds and an
 * optional `Z` or `+HH:MM`/`-HH:MM` offset; without an offset the time is
 * taken as UTC. Precision beyond milliseconds is dropped.
 *
 * @throw ParseError if the text is not a timestamp.
 */
Timestamp parse_timestamp(std::string_view text);

/**
 * @brief One record of the append-only session log.
 *
 * @details
 * Log entries have no id; two entries are equal when all fields are equal.
 */
struct LogEntry
{
    std::string session;
    Timestamp timestamp;
    std::string message;
    std::set<std::string> tags;
    std::map<std::string, std::string> metadata;
    bool occlude{false};

    /**
     * @brief Create an entry stamped with the current time (millisecond precision).
     */
    static LogEntry create(
        std::string session,
        std::string message,
        std::set<std::string> tags = {},
        std::map<std::string, std::string> metadata = {});

    bool has_tag(const std::string& tag) const
    {
        return tags.count(tag) != 0;
    }

    bool has_any_tag(const std::vector<std::string>& wanted) const;

    bool operator==(const LogEntry& other) const
    {
        return session == other.session && timestamp == other.timestamp &&
            message == other.message && tags == other.tags && metadata == other.metadata &&
            occlude == other.occlude;
    }

    bool operator!=(const LogEntry& other) const
    {
        return !(*this == other);
    }
};

} // namespace giantt
