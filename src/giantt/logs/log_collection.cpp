/**
 * @file log_collection.cpp
 */
#include "giantt/logs/log_collection.hpp"

#include <cctype>

namespace giantt
{

namespace
{

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool earlier(const LogEntry& a, const LogEntry& b)
{
    return a.timestamp < b.timestamp;
}

} // namespace

LogCollection::LogCollection(std::vector<LogEntry> entries)
    : m_entries(std::move(entries))
{
    std::stable_sort(m_entries.begin(), m_entries.end(), earlier);
}

void LogCollection::add(LogEntry entry)
{
    auto pos = std::upper_bound(m_entries.begin(), m_entries.end(), entry, earlier);
    m_entries.insert(pos, std::move(entry));
}

const LogEntry& LogCollection::create(
    std::string session,
    std::string message,
    std::set<std::string> tags,
    std::map<std::string, std::string> metadata)
{
    LogEntry entry = LogEntry::create(
        std::move(session), std::move(message), std::move(tags), std::move(metadata));
    auto pos = std::upper_bound(m_entries.begin(), m_entries.end(), entry, earlier);
    return *m_entries.insert(pos, std::move(entry));
}

// ============================================================================
// Queries
// ============================================================================

std::vector<LogEntry> LogCollection::by_session(const std::string& session) const
{
    std::vector<LogEntry> result;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(result),
        [&session](const LogEntry& entry) { return entry.session == session; });
    return result;
}

std::vector<LogEntry> LogCollection::with_tags(const std::vector<std::string>& tags, bool require_all) const
{
    std::vector<LogEntry> result;
    for (const auto& entry : m_entries)
    {
        const bool match = require_all
            ? std::all_of(tags.begin(), tags.end(),
                  [&entry](const std::string& tag) { return entry.has_tag(tag); })
            : entry.has_any_tag(tags);
        if (match)
        {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<LogEntry> LogCollection::containing(const std::string& text) const
{
    const std::string needle = to_lower(text);
    std::vector<LogEntry> result;
    for (const auto& entry : m_entries)
    {
        if (to_lower(entry.message).find(needle) != std::string::npos)
        {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<LogEntry> LogCollection::between(Timestamp from, Timestamp to) const
{
    std::vector<LogEntry> result;
    for (const auto& entry : m_entries)
    {
        if (entry.timestamp >= from && entry.timestamp <= to)
        {
            result.push_back(entry);
        }
    }
    return result;
}

std::vector<std::string> LogCollection::sessions() const
{
    std::vector<std::string> result;
    for (const auto& entry : m_entries)
    {
        if (std::find(result.begin(), result.end(), entry.session) == result.end())
        {
            result.push_back(entry.session);
        }
    }
    return result;
}

std::vector<LogEntry> LogCollection::included_entries() const
{
    std::vector<LogEntry> result;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(result),
        [](const LogEntry& entry) { return !entry.occlude; });
    return result;
}

std::vector<LogEntry> LogCollection::occluded_entries() const
{
    std::vector<LogEntry> result;
    std::copy_if(m_entries.begin(), m_entries.end(), std::back_inserter(result),
        [](const LogEntry& entry) { return entry.occlude; });
    return result;
}

// ============================================================================
// Occlusion
// ============================================================================

LogOccludeResult LogCollection::occlude_if(
    const std::function<bool(const LogEntry&)>& pred,
    bool dry_run)
{
    LogOccludeResult result;
    result.dry_run = dry_run;
    for (auto& entry : m_entries)
    {
        if (entry.occlude || !pred(entry))
        {
            continue;
        }
        if (!dry_run)
        {
            entry.occlude = true;
        }
        result.occluded.push_back(entry);
    }
    return result;
}

LogOccludeResult LogCollection::occlude_sessions(const std::vector<std::string>& sessions, bool dry_run)
{
    return occlude_if(
        [&sessions](const LogEntry& entry) {
            return std::find(sessions.begin(), sessions.end(), entry.session) != sessions.end();
        },
        dry_run);
}

LogOccludeResult LogCollection::occlude_tagged(const std::vector<std::string>& tags, bool dry_run)
{
    return occlude_if([&tags](const LogEntry& entry) { return entry.has_any_tag(tags); }, dry_run);
}

LogCollection LogCollection::operator+(const LogCollection& other) const
{
    std::vector<LogEntry> merged;
    merged.reserve(m_entries.size() + other.m_entries.size());
    std::merge(m_entries.begin(), m_entries.end(), other.m_entries.begin(), other.m_entries.end(),
        std::back_inserter(merged), earlier);
    LogCollection result;
    result.m_entries = std::move(merged);
    return result;
}

} // namespace giantt
