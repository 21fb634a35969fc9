/**
 * @file backup_manager.hpp
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/storage/storage_config.hpp"

#include <filesystem>

namespace giantt
{

/**
 * @brief A numbered backup of some file.
 */
struct BackupFile
{
    std::filesystem::path path;
    size_t number;
};

/**
 * @brief Creates and prunes numbered backups `<path>.<N>.backup`.
 *
 * @details
 * Backups live beside the file they copy. A new backup takes the number one
 * past the highest existing one, so numbers grow with recency even after
 * older backups were pruned.
 *
 * @par Deduplication
 * A backup whose content would be byte-identical to the most recent existing
 * backup is not created.
 *
 * @par Retention
 * After each backup, only the `retention` highest-numbered backups of that
 * file are kept. A retention of 0 keeps everything.
 */
class BackupManager
{
public:
    explicit BackupManager(size_t retention = k_default_backup_retention)
        : m_retention(retention)
    {
    }

    size_t retention() const noexcept
    {
        return m_retention;
    }

    /**
     * @brief Back up `path` if it exists, then prune unless `prune` is false.
     * @return The backup written, or std::nullopt if `path` does not exist or
     * its content equals the most recent backup.
     * @throw IOError on file system failure.
     */
    std::optional<std::filesystem::path> create_backup(
        const std::filesystem::path& path, bool prune = true) const;

    /**
     * @brief Existing backups of `path`, ascending by number.
     */
    std::vector<BackupFile> list_backups(const std::filesystem::path& path) const;

    /**
     * @brief Highest-numbered backup of `path`, if any.
     */
    std::optional<BackupFile> latest_backup(const std::filesystem::path& path) const;

    /**
     * @brief Delete all but the `retention` most recent backups of `path`.
     * @return Number of backups deleted.
     */
    size_t prune_backups(const std::filesystem::path& path) const;

    /**
     * @brief Prune the backups of several files.
     * @return Total number of backups deleted.
     */
    size_t cleanup_all(const std::vector<std::filesystem::path>& paths) const;

    /**
     * @brief Path of backup number `number` of `path`.
     */
    static std::filesystem::path backup_path(const std::filesystem::path& path, size_t number);

private:
    size_t m_retention;
};

} // namespace giantt
