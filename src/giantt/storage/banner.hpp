/**
 * @file banner.hpp
 * @brief `#`-bordered header blocks written at the top of workspace files.
 */
#pragma once
#include "giantt/common/common.hpp"

namespace giantt
{

/**
 * @brief Version of the on-disk item and log formats, stated in every banner.
 */
inline constexpr int k_schema_version = 1;

/**
 * @brief Build a fixed-width banner around some lines of text.
 *
 * @details
 * The banner is a full row of `#`, `padding_v` empty bordered rows, one
 * bordered row per text line with the text centered, `padding_v` empty rows,
 * and a closing full row. Every row has the same width in characters:
 * the longest text line plus `2 * padding_h` plus the two borders. Every row
 * ends with a newline.
 *
 * @code
 * ##############
 * #            #
 * #   Giantt   #
 * #            #
 * ##############
 * @endcode
 */
std::string create_banner(
    const std::vector<std::string>& lines,
    size_t padding_h = 5,
    size_t padding_v = 1);

/**
 * @brief Banner for an item file (`occluded` selects the archive variant).
 */
std::string items_banner(bool occluded);

/**
 * @brief Banner for a log file (`occluded` selects the archive variant).
 */
std::string logs_banner(bool occluded);

/**
 * @brief Banner for a metadata file (`occluded` selects the archive variant).
 */
std::string metadata_banner(bool occluded);

} // namespace giantt
