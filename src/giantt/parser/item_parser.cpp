/**
 * @file item_parser.cpp
 */
#include "giantt/parser/item_parser.hpp"
#include "giantt/common/errors.hpp"
#include "giantt/parser/scanner.hpp"
#include "giantt/parser/value_parser.hpp"

#include <cctype>

namespace giantt
{

namespace
{

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool is_id_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_tag_char(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

bool at_block_start(const Scanner& scanner)
{
    return scanner.starts_with(">>>") || scanner.starts_with("@@@") || scanner.peek() == '#';
}

template <typename Out>
void join_into(std::string& out, const std::vector<Out>& parts, const char* separator)
{
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
        {
            out += separator;
        }
        out += parts[i];
    }
}

// ============================================================================
// Field parsers
// ============================================================================

Status parse_status(Scanner& scanner)
{
    const size_t start = scanner.position();
    std::string_view token = scanner.take_token();
    auto status = status_from_symbol(token);
    if (!status)
    {
        scanner.fail_at(start, "unknown status symbol '" + std::string(token) + "'");
    }
    return *status;
}

void parse_id_and_priority(Scanner& scanner, Item& item)
{
    const size_t start = scanner.position();
    std::string_view token = scanner.take_token();
    auto [id, priority] = split_priority_suffix(token);
    if (id.empty())
    {
        scanner.fail_at(start, "missing item id");
    }
    for (size_t i = 0; i < id.size(); ++i)
    {
        if (!is_id_char(id[i]))
        {
            scanner.fail_at(start + i,
                "invalid character in id or unknown priority in '" + std::string(token) + "'");
        }
    }
    item.id = std::string(id);
    item.priority = priority;
}

std::vector<std::string> parse_charts(Scanner& scanner)
{
    std::vector<std::string> charts;
    scanner.expect("{", "'{' starting charts");
    scanner.skip_whitespace();
    if (scanner.accept("}"))
    {
        return charts;
    }
    while (true)
    {
        scanner.skip_whitespace();
        std::string chart = parse_json_string(scanner);
        if (!chart.empty())
        {
            charts.push_back(std::move(chart));
        }
        scanner.skip_whitespace();
        if (scanner.accept(","))
        {
            continue;
        }
        scanner.expect("}", "',' or '}' in charts");
        return charts;
    }
}

std::vector<std::string> parse_tags(Scanner& scanner)
{
    std::vector<std::string> tags;
    size_t tag_start = scanner.position();
    std::string_view token = scanner.take_token();
    size_t offset = 0;
    while (offset <= token.size())
    {
        size_t comma = token.find(',', offset);
        if (comma == std::string_view::npos)
        {
            comma = token.size();
        }
        std::string_view tag = token.substr(offset, comma - offset);
        if (tag.empty())
        {
            scanner.fail_at(tag_start + offset, "empty tag");
        }
        for (size_t i = 0; i < tag.size(); ++i)
        {
            if (!is_tag_char(tag[i]))
            {
                scanner.fail_at(tag_start + offset + i,
                    "tags may only contain lowercase letters, digits and underscores");
            }
        }
        tags.emplace_back(tag);
        offset = comma + 1;
    }
    return tags;
}

void parse_relations(Scanner& scanner, Item& item)
{
    bool any = false;
    while (true)
    {
        scanner.skip_whitespace();
        if (scanner.at_end() || scanner.starts_with("@@@") || scanner.peek() == '#')
        {
            break;
        }
        const size_t entry_start = scanner.position();
        std::string_view symbol =
            scanner.take_while([](char c) { return c != '[' && !is_space(c); });
        if (scanner.peek() != '[')
        {
            scanner.fail("expected '[' after relation symbol");
        }
        auto type = relation_from_symbol(symbol);
        if (!type)
        {
            scanner.fail_at(entry_start, "unknown relation symbol '" + std::string(symbol) + "'");
        }
        scanner.accept("[");
        const size_t body_start = scanner.position();
        std::string_view body = scanner.take_while([](char c) { return c != ']'; });
        scanner.expect("]", "']' closing relation targets");

        if (!trim(body).empty())
        {
            size_t offset = 0;
            while (offset <= body.size())
            {
                size_t comma = body.find(',', offset);
                if (comma == std::string_view::npos)
                {
                    comma = body.size();
                }
                std::string_view target = trim(body.substr(offset, comma - offset));
                if (target.empty())
                {
                    scanner.fail_at(body_start + offset, "empty relation target");
                }
                add_target(item.relations, *type, std::string(target));
                offset = comma + 1;
            }
        }
        any = true;
    }
    if (!any)
    {
        scanner.fail("expected relation after '>>>'");
    }
}

void parse_constraints(Scanner& scanner, Item& item)
{
    bool any = false;
    while (true)
    {
        scanner.skip_whitespace();
        if (scanner.at_end() || scanner.peek() == '#')
        {
            break;
        }
        item.time_constraints.push_back(parse_time_constraint(scanner));
        any = true;
    }
    if (!any)
    {
        scanner.fail("expected time constraint after '@@@'");
    }
}

void parse_comments(Scanner& scanner, Item& item)
{
    if (scanner.accept("###"))
    {
        item.auto_comment = std::string(trim(scanner.take_rest()));
        return;
    }
    scanner.expect("#", "'#' starting comment");
    std::string_view rest = scanner.take_rest();
    const size_t auto_pos = rest.find("###");
    if (auto_pos == std::string_view::npos)
    {
        item.user_comment = std::string(trim(rest));
        return;
    }
    item.user_comment = std::string(trim(rest.substr(0, auto_pos)));
    item.auto_comment = std::string(trim(rest.substr(auto_pos + 3)));
}

// A comment must read back unchanged: one line, no surrounding whitespace,
// and no "###" in the user part, which would start the auto comment.
void check_comment(const std::string& item_id, const std::string& comment, bool is_user)
{
    const char* kind = is_user ? "user" : "auto";
    if (comment.find_first_of("\r\n") != std::string::npos)
    {
        throw GianttError(GianttErrorCode::InvalidArgument,
            "Item '" + item_id + "': " + kind + " comment must be a single line");
    }
    if (!comment.empty() && (is_space(comment.front()) || is_space(comment.back())))
    {
        throw GianttError(GianttErrorCode::InvalidArgument,
            "Item '" + item_id + "': " + kind + " comment has surrounding whitespace");
    }
    if (is_user && comment.find("###") != std::string::npos)
    {
        throw GianttError(GianttErrorCode::InvalidArgument,
            "Item '" + item_id + "': user comment must not contain '###'");
    }
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

bool is_blank_line(std::string_view line) noexcept
{
    return trim(line).empty();
}

bool is_comment_line(std::string_view line) noexcept
{
    std::string_view text = trim(line);
    return !text.empty() && text.front() == '#';
}

Item parse_item(std::string_view line, bool occlude)
{
    Scanner scanner(trim(line));
    if (scanner.at_end())
    {
        scanner.fail("empty line");
    }
    if (scanner.peek() == '#')
    {
        scanner.fail("comment line is not an item");
    }

    Item item;
    item.occlude = occlude;
    item.status = parse_status(scanner);
    scanner.expect_whitespace("id");
    parse_id_and_priority(scanner, item);
    scanner.expect_whitespace("duration");
    item.duration = parse_duration(scanner);
    scanner.expect_whitespace("title");
    item.title = parse_json_string(scanner);

    bool spaced = scanner.skip_whitespace();
    if (scanner.peek() == '{')
    {
        item.charts = parse_charts(scanner);
        spaced = scanner.skip_whitespace();
    }
    if (!scanner.at_end() && !at_block_start(scanner))
    {
        if (!spaced)
        {
            scanner.fail("expected whitespace before tags");
        }
        item.tags = parse_tags(scanner);
        scanner.skip_whitespace();
    }
    if (scanner.accept(">>>"))
    {
        parse_relations(scanner, item);
    }
    if (scanner.accept("@@@"))
    {
        parse_constraints(scanner, item);
    }
    if (!scanner.at_end())
    {
        if (scanner.peek() != '#')
        {
            scanner.fail("unexpected text");
        }
        parse_comments(scanner, item);
    }
    return item;
}

std::string serialize_item(const Item& item)
{
    std::string line = status_symbol(item.status);
    line += ' ';
    line += item.id;
    line += priority_symbol(item.priority);
    line += ' ';
    line += item.duration.to_string();
    line += ' ';
    line += to_json_string(item.title);

    line += " {";
    for (size_t i = 0; i < item.charts.size(); ++i)
    {
        if (i > 0)
        {
            line += ',';
        }
        line += to_json_string(item.charts[i]);
    }
    line += '}';

    if (!item.tags.empty())
    {
        line += ' ';
        join_into(line, item.tags, ",");
    }

    bool relations_open = false;
    for (const auto& [type, targets] : item.relations)
    {
        if (targets.empty())
        {
            continue;
        }
        if (!relations_open)
        {
            line += " >>>";
            relations_open = true;
        }
        line += ' ';
        line += relation_info(type).symbol;
        line += '[';
        join_into(line, targets, ",");
        line += ']';
    }

    if (!item.time_constraints.empty())
    {
        line += " @@@";
        for (const auto& constraint : item.time_constraints)
        {
            line += ' ';
            line += constraint.to_string();
        }
    }

    if (item.user_comment)
    {
        check_comment(item.id, *item.user_comment, true);
        line += " # ";
        line += *item.user_comment;
    }
    if (item.auto_comment)
    {
        check_comment(item.id, *item.auto_comment, false);
        line += " ### ";
        line += *item.auto_comment;
    }
    return line;
}

} // namespace giantt
