/**
 * @file log_serializer.cpp
 */
#include "giantt/logs/log_serializer.hpp"
#include "giantt/common/errors.hpp"

namespace giantt
{

using json = nlohmann::json;

namespace
{

const std::string& require_string(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
    {
        throw ParseError(std::string("Log entry needs a string '") + key + "'", object.dump());
    }
    return it->get_ref<const std::string&>();
}

} // namespace

json log_entry_to_json(const LogEntry& entry)
{
    json object = json::object();
    object["s"] = entry.session;
    object["t"] = format_timestamp(entry.timestamp);
    object["m"] = entry.message;
    object["tags"] = json::array();
    for (const auto& tag : entry.tags)
    {
        object["tags"].push_back(tag);
    }
    object["meta"] = json::object();
    for (const auto& [key, value] : entry.metadata)
    {
        object["meta"][key] = value;
    }
    return object;
}

LogEntry log_entry_from_json(const json& object, bool occlude)
{
    if (!object.is_object())
    {
        throw ParseError("Log entry must be a JSON object", object.dump());
    }
    LogEntry entry;
    entry.session = require_string(object, "s");
    entry.timestamp = parse_timestamp(require_string(object, "t"));
    entry.message = require_string(object, "m");
    entry.occlude = occlude;

    auto tags = object.find("tags");
    if (tags != object.end() && !tags->is_null())
    {
        if (!tags->is_array())
        {
            throw ParseError("Log entry 'tags' must be an array", object.dump());
        }
        for (const auto& tag : *tags)
        {
            if (!tag.is_string())
            {
                throw ParseError("Log entry tags must be strings", object.dump());
            }
            entry.tags.insert(tag.get<std::string>());
        }
    }

    auto meta = object.find("meta");
    if (meta != object.end() && !meta->is_null())
    {
        if (!meta->is_object())
        {
            throw ParseError("Log entry 'meta' must be an object", object.dump());
        }
        for (const auto& [key, value] : meta->items())
        {
            entry.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return entry;
}

std::string serialize_log_entry(const LogEntry& entry)
{
    return log_entry_to_json(entry).dump(-1, ' ', false, json::error_handler_t::replace);
}

LogEntry parse_log_entry(std::string_view line, bool occlude)
{
    json object;
    try
    {
        object = json::parse(line.begin(), line.end());
    }
    catch (const json::parse_error& e)
    {
        throw ParseError(std::string("Invalid log line: ") + e.what(), std::string(line));
    }
    return log_entry_from_json(object, occlude);
}

} // namespace giantt
