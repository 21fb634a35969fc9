/**
 * @file atomic_writer.hpp
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/storage/storage_config.hpp"

#include <filesystem>

namespace giantt
{

/**
 * @brief One file of a write batch.
 */
struct FileWrite
{
    std::filesystem::path path;
    std::string content;
};

/**
 * @brief Writes batches of files all-or-nothing.
 *
 * @details
 * A batch goes through three phases:
 * 1. **Stage**: each target's content is written to `<path>.tmp` in the
 *    target's directory (created if missing).
 * 2. **Back up**: existing targets are copied to numbered backups, if
 *    enabled in the configuration.
 * 3. **Swap**: each temp file is renamed over its target. A copy of every
 *    original is held as `<path>.rollback` until the whole batch is in place.
 *
 * If any step fails, temp files are removed and originals already replaced
 * are restored from their rollback copies, so either every target holds its
 * new content or every target is as before. Backups made in phase 2 are
 * removed again, and older backups are pruned to the retention limit only
 * once every swap has succeeded.
 *
 * This protects against a failing or crashing single writer; it does not
 * coordinate concurrent writers.
 */
class AtomicFileWriter
{
public:
    explicit AtomicFileWriter(StorageConfig config = {})
        : m_config(config)
    {
    }

    const StorageConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Write a batch of files atomically.
     * @throw GraphException (WriteFailed) if the batch could not be written;
     * no target is modified in that case.
     */
    void write_files(const std::vector<FileWrite>& files) const;

    /**
     * @brief Write a single file atomically.
     * @throw GraphException (WriteFailed) on failure.
     */
    void write_file(const std::filesystem::path& path, const std::string& content) const
    {
        write_files({FileWrite{path, content}});
    }

    /**
     * @brief Path of the staging file for `path`.
     */
    static std::filesystem::path temp_path(const std::filesystem::path& path);

private:
    StorageConfig m_config;
};

} // namespace giantt
