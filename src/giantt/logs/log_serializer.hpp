/**
 * @file log_serializer.hpp
 * @brief JSON Lines encoding of log entries.
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/model/log_entry.hpp"

#include <nlohmann/json.hpp>

namespace giantt
{

/**
 * @brief Encode an entry as a JSON object.
 *
 * @details
 * Keys: `s` (session), `t` (ISO-8601 UTC timestamp), `m` (message), `tags`
 * (sorted array of strings) and `meta` (object of strings). The occluded flag
 * is not stored; it follows from the file an entry is kept in.
 */
nlohmann::json log_entry_to_json(const LogEntry& entry);

/**
 * @brief Decode an entry from a JSON object.
 *
 * @details
 * `s`, `t` and `m` are required. `tags` and `meta` may be missing; metadata
 * values that are not strings are kept as their JSON text.
 *
 * @throw ParseError if a required key is missing or has the wrong type.
 */
LogEntry log_entry_from_json(const nlohmann::json& json, bool occlude = false);

/**
 * @brief Encode an entry as one line of JSON (without a newline).
 */
std::string serialize_log_entry(const LogEntry& entry);

/**
 * @brief Decode one JSON Lines line.
 * @throw ParseError if the line is not a valid entry.
 */
LogEntry parse_log_entry(std::string_view line, bool occlude = false);

} // namespace giantt
