/**
 * @file workspace.hpp
 */
#pragma once
#include "giantt/common/common.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace giantt
{

/**
 * @brief Name of the directory holding a workspace inside a project.
 */
inline constexpr const char* k_workspace_dir_name = ".giantt";

/**
 * @brief The six files of a workspace rooted at `base`.
 *
 * @details
 * @code
 * base/include/items.txt     base/occlude/items.txt
 * base/include/metadata.json base/occlude/metadata.json
 * base/include/logs.jsonl    base/occlude/logs.jsonl
 * @endcode
 */
struct WorkspacePaths
{
    std::filesystem::path base;
    std::filesystem::path include_items;
    std::filesystem::path include_metadata;
    std::filesystem::path include_logs;
    std::filesystem::path occlude_items;
    std::filesystem::path occlude_metadata;
    std::filesystem::path occlude_logs;

    static WorkspacePaths for_base(const std::filesystem::path& base);

    std::vector<std::filesystem::path> all() const;
};

/**
 * @brief Create the workspace directories and any missing files.
 *
 * @details
 * Item and log files start with their banner; metadata files hold a banner
 * and an empty JSON object. Existing files are left alone, so calling this on
 * an initialized workspace changes nothing.
 *
 * @throw GraphException if the files cannot be written.
 */
WorkspacePaths initialize_workspace(const std::filesystem::path& base);

/**
 * @brief Whether all six workspace files exist.
 */
bool is_workspace_initialized(const std::filesystem::path& base);

/**
 * @brief Check that every workspace file exists and is a readable file.
 * @throw GraphException (WorkspaceInvalid) naming the first offending file.
 */
void validate_workspace(const std::filesystem::path& base);

/**
 * @brief Find the nearest workspace directory at or above `start`.
 * @return `<dir>/.giantt` for the closest ancestor `dir` that has one.
 */
std::optional<std::filesystem::path> find_workspace(const std::filesystem::path& start);

/**
 * @brief Read the JSON body of a metadata file, skipping `#` comment lines.
 *
 * @details
 * An empty body reads as an empty object.
 *
 * @throw IOError if the file cannot be read.
 * @throw ParseError if the body is not a JSON object.
 */
nlohmann::json load_metadata(const std::filesystem::path& path);

} // namespace giantt
