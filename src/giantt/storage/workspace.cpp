/**
 * @file workspace.cpp
 */
#include "giantt/storage/workspace.hpp"
#include "giantt/common/errors.hpp"
#include "giantt/common/logging.hpp"
#include "giantt/parser/scanner.hpp"
#include "giantt/storage/atomic_writer.hpp"
#include "giantt/storage/banner.hpp"
#include "giantt/storage/file_io.hpp"

#include <fstream>

namespace giantt
{

namespace fs = std::filesystem;

WorkspacePaths WorkspacePaths::for_base(const fs::path& base)
{
    WorkspacePaths paths;
    paths.base = base;
    paths.include_items = base / "include" / "items.txt";
    paths.include_metadata = base / "include" / "metadata.json";
    paths.include_logs = base / "include" / "logs.jsonl";
    paths.occlude_items = base / "occlude" / "items.txt";
    paths.occlude_metadata = base / "occlude" / "metadata.json";
    paths.occlude_logs = base / "occlude" / "logs.jsonl";
    return paths;
}

std::vector<fs::path> WorkspacePaths::all() const
{
    return {include_items, include_metadata, include_logs,
        occlude_items, occlude_metadata, occlude_logs};
}

WorkspacePaths initialize_workspace(const fs::path& base)
{
    const WorkspacePaths paths = WorkspacePaths::for_base(base);
    const std::string empty_metadata = "{}\n";
    const std::vector<FileWrite> templates{
        {paths.include_items, items_banner(false) + "\n"},
        {paths.include_metadata, metadata_banner(false) + "\n" + empty_metadata},
        {paths.include_logs, logs_banner(false) + "\n"},
        {paths.occlude_items, items_banner(true) + "\n"},
        {paths.occlude_metadata, metadata_banner(true) + "\n" + empty_metadata},
        {paths.occlude_logs, logs_banner(true) + "\n"},
    };

    std::vector<FileWrite> missing;
    for (const auto& file : templates)
    {
        std::error_code ec;
        if (!fs::exists(file.path, ec))
        {
            missing.push_back(file);
        }
    }
    if (!missing.empty())
    {
        StorageConfig config;
        config.create_backups = false;
        AtomicFileWriter(config).write_files(missing);
        logger()->info("Initialized workspace at {} ({} file(s) created)", base.string(),
            missing.size());
    }
    return paths;
}

bool is_workspace_initialized(const fs::path& base)
{
    const WorkspacePaths paths = WorkspacePaths::for_base(base);
    for (const auto& path : paths.all())
    {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            return false;
        }
    }
    return true;
}

void validate_workspace(const fs::path& base)
{
    const WorkspacePaths paths = WorkspacePaths::for_base(base);
    for (const auto& path : paths.all())
    {
        std::error_code ec;
        if (!fs::exists(path, ec))
        {
            throw GraphException(GianttErrorCode::WorkspaceInvalid,
                "Workspace file missing: " + path.string());
        }
        if (!fs::is_regular_file(path, ec))
        {
            throw GraphException(GianttErrorCode::WorkspaceInvalid,
                "Workspace path is not a file: " + path.string());
        }
        std::ifstream readable(path, std::ios::binary);
        if (!readable)
        {
            throw GraphException(GianttErrorCode::WorkspaceInvalid,
                "Workspace file not readable: " + path.string());
        }
    }
}

std::optional<fs::path> find_workspace(const fs::path& start)
{
    fs::path dir = fs::absolute(start).lexically_normal();
    while (true)
    {
        const fs::path candidate = dir / k_workspace_dir_name;
        std::error_code ec;
        if (fs::is_directory(candidate, ec))
        {
            return candidate;
        }
        const fs::path parent = dir.parent_path();
        if (parent.empty() || parent == dir)
        {
            return std::nullopt;
        }
        dir = parent;
    }
}

nlohmann::json load_metadata(const fs::path& path)
{
    const std::string content = read_text_file(path);
    std::string body;
    for (const auto& line : split_lines(content))
    {
        std::string_view text = trim(line);
        if (!text.empty() && text.front() == '#')
        {
            continue;
        }
        body += line;
        body += '\n';
    }
    if (trim(body).empty())
    {
        return nlohmann::json::object();
    }

    nlohmann::json metadata;
    try
    {
        metadata = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw ParseError("Invalid metadata in " + path.string() + ": " + e.what(), body);
    }
    if (!metadata.is_object())
    {
        throw ParseError("Metadata in " + path.string() + " is not a JSON object", body);
    }
    return metadata;
}

} // namespace giantt
