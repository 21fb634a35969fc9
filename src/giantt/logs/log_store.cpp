/**
 * @file log_store.cpp
 */
#include "giantt/logs/log_store.hpp"
#include "giantt/common/errors.hpp"
#include "giantt/common/logging.hpp"
#include "giantt/logs/log_serializer.hpp"
#include "giantt/parser/scanner.hpp"
#include "giantt/storage/atomic_writer.hpp"
#include "giantt/storage/banner.hpp"
#include "giantt/storage/file_io.hpp"

namespace giantt
{

namespace fs = std::filesystem;

namespace
{

std::string render_log_file(const LogCollection& logs, bool occluded)
{
    std::string content = logs_banner(occluded) + "\n";
    for (const auto& entry : logs.entries())
    {
        if (entry.occlude == occluded)
        {
            content += serialize_log_entry(entry);
            content += '\n';
        }
    }
    return content;
}

} // namespace

std::vector<LogEntry> load_log_file(const fs::path& path, bool occlude, const LoadConfig& config)
{
    std::vector<LogEntry> entries;
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        return entries;
    }
    const std::vector<std::string> lines = split_lines(read_text_file(path));
    for (size_t i = 0; i < lines.size(); ++i)
    {
        std::string_view line = trim(lines[i]);
        if (line.empty() || line.front() == '#')
        {
            continue;
        }
        try
        {
            entries.push_back(parse_log_entry(line, occlude));
        }
        catch (const ParseError& e)
        {
            if (config.strict)
            {
                throw;
            }
            logger()->warn("{}:{}: skipping invalid log line: {}", path.string(), i + 1, e.what());
        }
    }
    logger()->debug("Loaded {} log entries from {}", entries.size(), path.string());
    return entries;
}

LogCollection load_logs(const fs::path& include_path, const fs::path& occlude_path, const LoadConfig& config)
{
    std::vector<LogEntry> entries = load_log_file(include_path, false, config);
    std::vector<LogEntry> archived = load_log_file(occlude_path, true, config);
    entries.insert(entries.end(), std::make_move_iterator(archived.begin()),
        std::make_move_iterator(archived.end()));
    return LogCollection(std::move(entries));
}

void save_logs(
    const fs::path& include_path,
    const fs::path& occlude_path,
    const LogCollection& logs,
    const StorageConfig& config)
{
    AtomicFileWriter(config).write_files({
        FileWrite{include_path, render_log_file(logs, false)},
        FileWrite{occlude_path, render_log_file(logs, true)},
    });
}

} // namespace giantt
