/**
 * @file value_parser.hpp
 * @brief Sub-grammars of the item notation: durations, time constraints and
 * JSON string literals.
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/model/duration.hpp"
#include "giantt/model/time_constraint.hpp"
#include "giantt/parser/scanner.hpp"

namespace giantt
{

// ============================================================================
// Durations
// ============================================================================

/**
 * @brief Parse `<number><unit>` pairs from the scanner's position.
 *
 * @details
 * Stops at the first byte that cannot start another pair, leaving it
 * unconsumed. At least one pair is required.
 *
 * @throw ParseError on a missing number, or an unknown or missing unit.
 */
Duration parse_duration(Scanner& scanner);

/**
 * @brief Parse a complete duration such as `1h30min`.
 * @throw ParseError if the text is not exactly one duration.
 */
Duration parse_duration(std::string_view text);

// ============================================================================
// Time constraints
// ============================================================================

/**
 * @brief Parse one `window(...)`, `due(...)` or `every(...)` expression.
 * @throw ParseError on any malformed expression.
 */
TimeConstraint parse_time_constraint(Scanner& scanner);

/**
 * @brief Parse a complete time constraint expression.
 * @throw ParseError if the text is not exactly one constraint.
 */
TimeConstraint parse_time_constraint(std::string_view text);

// ============================================================================
// JSON string literals
// ============================================================================

/**
 * @brief Parse a double-quoted JSON string literal and decode its escapes.
 * @throw ParseError if no well-formed literal starts at the scanner position.
 */
std::string parse_json_string(Scanner& scanner);

/**
 * @brief Encode text as a double-quoted JSON string literal.
 *
 * @details
 * Non-ASCII text is written as UTF-8, not as `\u` escapes. Invalid UTF-8
 * sequences are replaced with U+FFFD.
 */
std::string to_json_string(const std::string& text);

} // namespace giantt
