/**
 * @file path_resolver.hpp
 * @brief Path helpers for include directives and workspace files.
 */
#pragma once
#include "giantt/common/common.hpp"

#include <filesystem>

namespace giantt
{

/**
 * @brief Convert separators to the host's preferred one and collapse `.`,
 * `..` and repeated separators lexically.
 *
 * @details
 * An empty path normalizes to `.`. Trailing separators are dropped.
 */
std::string normalize_path(std::string_view path);

/**
 * @brief Whether a path is absolute under the host's conventions.
 *
 * @details
 * On POSIX hosts a path is absolute when it starts with `/`. On Windows a
 * drive-letter path (`C:\...` or `C:/...`) or a UNC path (`\\server\...`) is
 * absolute.
 */
bool is_absolute_path(std::string_view path) noexcept;

/**
 * @brief Resolve `path` against `base_dir` unless it is already absolute.
 * @return The normalized result.
 */
std::filesystem::path resolve_path(const std::filesystem::path& base_dir, std::string_view path);

/**
 * @brief Relative path from directory `from_dir` to `to`, for display.
 *
 * @details
 * Both paths are normalized first and joined with `/` in the result. Equal
 * paths give `.`. If no relative path exists (different roots), the
 * normalized `to` is returned.
 */
std::string relative_path(const std::filesystem::path& from_dir, const std::filesystem::path& to);

/**
 * @brief Make an arbitrary string usable as a file name.
 *
 * @details
 * Strips the characters `< > : " / \ | ? *` and control characters, keeping
 * everything else (including non-ASCII text) in order. Returns `untitled` if
 * nothing remains.
 */
std::string safe_filename(std::string_view name);

} // namespace giantt
