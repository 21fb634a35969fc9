/**
 * @file item_parser.hpp
 * @brief Line notation for items.
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/model/item.hpp"

namespace giantt
{

/**
 * @brief Parse one item line.
 *
 * @details
 * The line notation is:
 * @code
 * status id<priority> duration "title" {charts} [tags] [>>> rel[targets]...]
 *     [@@@ constraint...] [# comment] [### autocomment]
 * @endcode
 * for example
 * @code
 * ◑ write_report!! 2d "Write the report" {"Work"} writing >>> ⊢[collect_data]
 * @endcode
 *
 * Surrounding whitespace (including a trailing CR) is ignored. The `occlude`
 * flag of the result is taken from the argument, since it is decided by which
 * file the line came from.
 *
 * @throw ParseError on any structural mismatch, including a line that is a
 * comment or banner line.
 */
Item parse_item(std::string_view line, bool occlude = false);

/**
 * @brief Render an item as one line of notation (without a newline).
 *
 * @details
 * Relation buckets are written in canonical relation order. Charts are
 * always written, as `{}` when there are none.
 *
 * @throw GianttError (InvalidArgument) if a comment could not be read back
 * unchanged: it spans lines, has leading or trailing whitespace, or is a
 * user comment containing `###`.
 */
std::string serialize_item(const Item& item);

/**
 * @brief True for a line whose first non-blank character is `#`.
 */
bool is_comment_line(std::string_view line) noexcept;

/**
 * @brief True for an empty or whitespace-only line.
 */
bool is_blank_line(std::string_view line) noexcept;

} // namespace giantt
