/**
 * @file backup_manager.cpp
 */
#include "giantt/storage/backup_manager.hpp"
#include "giantt/common/errors.hpp"
#include "giantt/common/logging.hpp"
#include "giantt/storage/file_io.hpp"

#include <cctype>

namespace giantt
{

namespace fs = std::filesystem;

namespace
{

constexpr std::string_view k_backup_suffix = ".backup";

// Parses "<base>.<N>.backup" and returns N.
std::optional<size_t> backup_number(const std::string& base_name, const std::string& file_name)
{
    const std::string prefix = base_name + ".";
    if (file_name.size() <= prefix.size() + k_backup_suffix.size() ||
        file_name.compare(0, prefix.size(), prefix) != 0 ||
        file_name.compare(file_name.size() - k_backup_suffix.size(), k_backup_suffix.size(),
            k_backup_suffix) != 0)
    {
        return std::nullopt;
    }
    const std::string digits = file_name.substr(
        prefix.size(), file_name.size() - prefix.size() - k_backup_suffix.size());
    if (digits.empty() || digits.size() > 18 ||
        !std::all_of(digits.begin(), digits.end(),
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
    {
        return std::nullopt;
    }
    return static_cast<size_t>(std::stoull(digits));
}

} // namespace

fs::path BackupManager::backup_path(const fs::path& path, size_t number)
{
    fs::path result = path;
    result += "." + std::to_string(number) + std::string(k_backup_suffix);
    return result;
}

std::vector<BackupFile> BackupManager::list_backups(const fs::path& path) const
{
    std::vector<BackupFile> backups;
    fs::path dir = path.parent_path();
    if (dir.empty())
    {
        dir = ".";
    }
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
    {
        return backups;
    }
    const std::string base_name = path.filename().string();
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        throw IOError("Cannot list '" + dir.string() + "': " + ec.message());
    }
    for (const auto& entry : it)
    {
        auto number = backup_number(base_name, entry.path().filename().string());
        if (number)
        {
            backups.push_back(BackupFile{entry.path(), *number});
        }
    }
    std::sort(backups.begin(), backups.end(),
        [](const BackupFile& a, const BackupFile& b) { return a.number < b.number; });
    return backups;
}

std::optional<BackupFile> BackupManager::latest_backup(const fs::path& path) const
{
    auto backups = list_backups(path);
    if (backups.empty())
    {
        return std::nullopt;
    }
    return backups.back();
}

std::optional<fs::path> BackupManager::create_backup(const fs::path& path, bool prune) const
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        return std::nullopt;
    }

    const std::string content = read_text_file(path);
    auto latest = latest_backup(path);
    if (latest && read_text_file(latest->path) == content)
    {
        logger()->debug("Skipping backup of {}: identical to {}", path.string(),
            latest->path.filename().string());
        return std::nullopt;
    }

    const fs::path target = backup_path(path, latest ? latest->number + 1 : 1);
    fs::copy_file(path, target, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw IOError("Cannot back up '" + path.string() + "' to '" + target.string() +
            "': " + ec.message());
    }
    logger()->debug("Created backup {}", target.string());
    if (prune)
    {
        prune_backups(path);
    }
    return target;
}

size_t BackupManager::prune_backups(const fs::path& path) const
{
    if (m_retention == 0)
    {
        return 0;
    }
    auto backups = list_backups(path);
    if (backups.size() <= m_retention)
    {
        return 0;
    }
    size_t removed = 0;
    const size_t excess = backups.size() - m_retention;
    for (size_t i = 0; i < excess; ++i)
    {
        std::error_code ec;
        if (fs::remove(backups[i].path, ec))
        {
            ++removed;
            logger()->debug("Pruned backup {}", backups[i].path.string());
        }
        else if (ec)
        {
            logger()->warn("Could not prune backup {}: {}", backups[i].path.string(), ec.message());
        }
    }
    return removed;
}

size_t BackupManager::cleanup_all(const std::vector<fs::path>& paths) const
{
    size_t removed = 0;
    for (const auto& path : paths)
    {
        removed += prune_backups(path);
    }
    return removed;
}

} // namespace giantt
