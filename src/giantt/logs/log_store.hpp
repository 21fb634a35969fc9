/**
 * @file log_store.hpp
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/logs/log_collection.hpp"
#include "giantt/storage/storage_config.hpp"

#include <filesystem>

namespace giantt
{

/**
 * @brief Read the entries of one JSON Lines log file.
 *
 * @details
 * Blank lines and `#` lines (the banner) are skipped. Invalid lines are
 * skipped with a warning unless `config.strict` is set. A missing file reads
 * as no entries.
 *
 * @throw IOError if the file exists but cannot be read.
 * @throw ParseError for an invalid line when `config.strict` is set.
 */
std::vector<LogEntry> load_log_file(
    const std::filesystem::path& path,
    bool occlude,
    const LoadConfig& config = {});

/**
 * @brief Load active and archived log entries into one collection.
 */
LogCollection load_logs(
    const std::filesystem::path& include_path,
    const std::filesystem::path& occlude_path,
    const LoadConfig& config = {});

/**
 * @brief Write a collection to its include/occlude file pair in one atomic
 * batch, each file starting with a fresh banner.
 *
 * @throw GraphException if the write batch fails; no file is modified.
 */
void save_logs(
    const std::filesystem::path& include_path,
    const std::filesystem::path& occlude_path,
    const LogCollection& logs,
    const StorageConfig& config = {});

} // namespace giantt
