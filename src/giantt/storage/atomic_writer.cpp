/**
 * @file atomic_writer.cpp
 */
#include "giantt/storage/atomic_writer.hpp"
#include "giantt/common/errors.hpp"
#include "giantt/common/logging.hpp"
#include "giantt/storage/backup_manager.hpp"
#include "giantt/storage/file_io.hpp"

namespace giantt
{

namespace fs = std::filesystem;

namespace
{

fs::path rollback_path(const fs::path& path)
{
    fs::path result = path;
    result += ".rollback";
    return result;
}

void remove_quietly(const fs::path& path)
{
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
    {
        logger()->warn("Could not remove {}: {}", path.string(), ec.message());
    }
}

struct SwappedFile
{
    fs::path target;
    std::optional<fs::path> rollback;
};

} // namespace

fs::path AtomicFileWriter::temp_path(const fs::path& path)
{
    fs::path result = path;
    result += ".tmp";
    return result;
}

void AtomicFileWriter::write_files(const std::vector<FileWrite>& files) const
{
    std::vector<fs::path> staged;
    auto discard_staged = [&staged]() {
        for (const auto& temp : staged)
        {
            remove_quietly(temp);
        }
    };

    // ========================================================================
    // Stage
    // ========================================================================

    for (const auto& file : files)
    {
        const fs::path temp = temp_path(file.path);
        try
        {
            const fs::path dir = file.path.parent_path();
            if (!dir.empty())
            {
                std::error_code ec;
                fs::create_directories(dir, ec);
                if (ec)
                {
                    throw IOError("Cannot create directory '" + dir.string() + "': " + ec.message());
                }
            }
            staged.push_back(temp);
            write_text_file(temp, file.content);
        }
        catch (const GianttError& e)
        {
            discard_staged();
            throw GraphException(GianttErrorCode::WriteFailed,
                "Write batch aborted; no files were modified: " + std::string(e.what()));
        }
    }

    // ========================================================================
    // Back up
    // ========================================================================

    // Pruning waits until the swap succeeded; a failed batch leaves the
    // existing backups as they were.
    const BackupManager backups(m_config.backup_retention);
    std::vector<fs::path> created_backups;
    auto discard_backups = [&created_backups]() {
        for (const auto& backup : created_backups)
        {
            remove_quietly(backup);
        }
    };

    if (m_config.create_backups)
    {
        for (const auto& file : files)
        {
            try
            {
                if (auto backup = backups.create_backup(file.path, false))
                {
                    created_backups.push_back(*backup);
                }
            }
            catch (const GianttError& e)
            {
                discard_backups();
                discard_staged();
                throw GraphException(GianttErrorCode::WriteFailed,
                    "Write batch aborted; no files were modified: " + std::string(e.what()));
            }
        }
    }

    // ========================================================================
    // Swap
    // ========================================================================

    std::vector<SwappedFile> swapped;
    std::string failure;
    for (size_t i = 0; i < files.size(); ++i)
    {
        const fs::path& target = files[i].path;
        SwappedFile entry{target, std::nullopt};
        std::error_code ec;
        if (fs::exists(target, ec))
        {
            const fs::path rollback = rollback_path(target);
            fs::copy_file(target, rollback, fs::copy_options::overwrite_existing, ec);
            if (ec)
            {
                failure = "cannot keep a rollback copy of '" + target.string() + "': " + ec.message();
                break;
            }
            entry.rollback = rollback;
        }
        swapped.push_back(entry);
        fs::rename(staged[i], target, ec);
        if (ec)
        {
            failure = "cannot replace '" + target.string() + "': " + ec.message();
            break;
        }
    }

    if (!failure.empty())
    {
        for (const auto& entry : swapped)
        {
            std::error_code ec;
            if (entry.rollback)
            {
                fs::rename(*entry.rollback, entry.target, ec);
                if (ec)
                {
                    logger()->error("Could not restore {} from {}: {}", entry.target.string(),
                        entry.rollback->string(), ec.message());
                }
            }
            else
            {
                remove_quietly(entry.target);
            }
        }
        discard_backups();
        discard_staged();
        throw GraphException(GianttErrorCode::WriteFailed,
            "Write batch aborted; original files restored: " + failure);
    }

    for (const auto& entry : swapped)
    {
        if (entry.rollback)
        {
            remove_quietly(*entry.rollback);
        }
    }

    if (m_config.create_backups)
    {
        for (const auto& file : files)
        {
            try
            {
                backups.prune_backups(file.path);
            }
            catch (const IOError& e)
            {
                logger()->warn("Could not prune backups of {}: {}", file.path.string(), e.what());
            }
        }
    }
    logger()->debug("Wrote {} file(s) atomically", files.size());
}

} // namespace giantt
