/**
 * @file storage_config.hpp
 */
#pragma once
#include "giantt/common/common.hpp"

namespace giantt
{

/**
 * @brief Number of numbered backups kept per file unless configured otherwise.
 */
inline constexpr size_t k_default_backup_retention = 3;

/**
 * @brief Configuration for saves and atomic write batches.
 */
struct StorageConfig
{
    /**
     * @brief How many numbered backups to keep per file.
     * @details 0 disables pruning.
     */
    size_t backup_retention{k_default_backup_retention};

    /**
     * @brief Whether to back up existing files before replacing them.
     */
    bool create_backups{true};
};

/**
 * @brief Configuration for loading item and log files.
 */
struct LoadConfig
{
    /**
     * @brief Whether an invalid line aborts the load.
     * @details If false, invalid lines are skipped with a warning.
     */
    bool strict{false};
};

} // namespace giantt
