/**
 * @file item_store.cpp
 */
#include "giantt/storage/item_store.hpp"
#include "giantt/common/errors.hpp"
#include "giantt/common/logging.hpp"
#include "giantt/parser/item_parser.hpp"
#include "giantt/parser/scanner.hpp"
#include "giantt/storage/atomic_writer.hpp"
#include "giantt/storage/banner.hpp"
#include "giantt/storage/file_io.hpp"
#include "giantt/storage/path_resolver.hpp"

namespace giantt
{

namespace fs = std::filesystem;

namespace
{

constexpr std::string_view k_include_keyword = "#include";

bool is_include_line(std::string_view trimmed)
{
    if (trimmed.substr(0, k_include_keyword.size()) != k_include_keyword)
    {
        return false;
    }
    if (trimmed.size() == k_include_keyword.size())
    {
        return true;
    }
    const char next = trimmed[k_include_keyword.size()];
    return next == ' ' || next == '\t' || next == '<' || next == '"';
}

std::string directive_path(std::string_view trimmed)
{
    std::string_view rest = trim(trimmed.substr(k_include_keyword.size()));
    if (rest.size() >= 2 &&
        ((rest.front() == '<' && rest.back() == '>') || (rest.front() == '"' && rest.back() == '"')))
    {
        rest = trim(rest.substr(1, rest.size() - 2));
    }
    if (rest.empty())
    {
        throw ParseError("#include directive without a path", std::string(trimmed),
            k_include_keyword.size());
    }
    return std::string(rest);
}

struct IncludeScan
{
    std::vector<std::string> includes;
    size_t body_start;
};

IncludeScan scan_includes(const std::vector<std::string>& lines)
{
    IncludeScan scan{{}, lines.size()};
    for (size_t i = 0; i < lines.size(); ++i)
    {
        std::string_view line = trim(lines[i]);
        if (line.empty())
        {
            continue;
        }
        if (is_include_line(line))
        {
            scan.includes.push_back(directive_path(line));
            continue;
        }
        if (line.front() == '#')
        {
            continue;
        }
        scan.body_start = i;
        break;
    }
    return scan;
}

// Identity used to recognize the same file reached through different paths.
fs::path file_identity(const fs::path& path)
{
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec)
    {
        return fs::absolute(path).lexically_normal();
    }
    return canonical;
}

std::string describe_cycle(const std::vector<fs::path>& chain, const fs::path& repeated)
{
    auto start = std::find(chain.begin(), chain.end(), repeated);
    std::string text;
    for (auto it = start; it != chain.end(); ++it)
    {
        text += it->string();
        text += " -> ";
    }
    return text + repeated.string();
}

void load_into(
    const fs::path& path,
    bool occlude,
    const LoadConfig& config,
    std::vector<fs::path>& chain,
    Graph& graph)
{
    const fs::path identity = file_identity(path);
    if (std::find(chain.begin(), chain.end(), identity) != chain.end())
    {
        throw GraphException(GianttErrorCode::CircularInclude,
            "Circular include detected: " + describe_cycle(chain, identity));
    }
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        if (chain.empty())
        {
            throw GraphException(GianttErrorCode::MissingFile, "File not found: " + path.string());
        }
        throw GraphException(GianttErrorCode::MissingFile,
            "Included file not found: " + path.string() + " (included from " +
                chain.back().string() + ")");
    }

    const std::vector<std::string> lines = split_lines(read_text_file(path));
    const IncludeScan scan = scan_includes(lines);

    chain.push_back(identity);
    for (const auto& include : scan.includes)
    {
        load_into(resolve_path(path.parent_path(), include), occlude, config, chain, graph);
    }
    chain.pop_back();

    size_t loaded = 0;
    for (size_t i = scan.body_start; i < lines.size(); ++i)
    {
        std::string_view line = trim(lines[i]);
        if (line.empty())
        {
            continue;
        }
        if (line.front() == '#')
        {
            if (is_include_line(line))
            {
                logger()->warn("{}:{}: #include after the first item is ignored", path.string(), i + 1);
            }
            continue;
        }
        try
        {
            graph.add_item(parse_item(line, occlude));
            ++loaded;
        }
        catch (const ParseError& e)
        {
            if (config.strict)
            {
                throw;
            }
            logger()->warn("{}:{}: skipping invalid item line: {}", path.string(), i + 1, e.what());
        }
    }
    logger()->debug("Loaded {} item(s) from {}", loaded, path.string());
}

std::string render_item_file(const fs::path& path, bool occluded, const std::vector<Item>& sorted)
{
    const std::vector<std::string> includes = parse_include_directives(path);

    Graph included;
    std::vector<fs::path> chain{file_identity(path)};
    for (const auto& include : includes)
    {
        load_into(resolve_path(path.parent_path(), include), occluded, LoadConfig{}, chain, included);
    }

    std::string content = items_banner(occluded) + "\n";
    if (!includes.empty())
    {
        for (const auto& include : includes)
        {
            content += std::string(k_include_keyword) + " " + include + "\n";
        }
        content += "\n";
    }
    for (const auto& item : sorted)
    {
        if (item.occlude != occluded)
        {
            continue;
        }
        const Item* inherited = included.find(item.id);
        if (inherited != nullptr && *inherited == item)
        {
            continue;
        }
        content += serialize_item(item);
        content += '\n';
    }
    return content;
}

void render_includes(
    const fs::path& path,
    const std::string& prefix,
    bool recursive,
    std::vector<fs::path>& chain,
    std::string& out)
{
    std::vector<std::string> includes;
    try
    {
        includes = parse_include_directives(path);
    }
    catch (const GianttError& e)
    {
        out += prefix + "\\-- (unreadable: " + e.what() + ")\n";
        return;
    }

    for (size_t i = 0; i < includes.size(); ++i)
    {
        const bool last = i + 1 == includes.size();
        const fs::path child = resolve_path(path.parent_path(), includes[i]);
        out += prefix + (last ? "\\-- " : "+-- ") + includes[i];

        std::error_code ec;
        if (!fs::exists(child, ec))
        {
            out += " (missing)\n";
            continue;
        }
        const fs::path identity = file_identity(child);
        if (std::find(chain.begin(), chain.end(), identity) != chain.end())
        {
            out += " (circular)\n";
            continue;
        }
        out += "\n";
        if (recursive)
        {
            chain.push_back(identity);
            render_includes(child, prefix + (last ? "    " : "|   "), recursive, chain, out);
            chain.pop_back();
        }
    }
}

} // namespace

std::vector<std::string> parse_include_directives(const fs::path& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        return {};
    }
    return scan_includes(split_lines(read_text_file(path))).includes;
}

Graph load_graph_from_file(const fs::path& path, bool occlude, const LoadConfig& config)
{
    Graph graph;
    std::vector<fs::path> chain;
    load_into(path, occlude, config, chain, graph);
    return graph;
}

Graph load_graph(const fs::path& include_path, const fs::path& occlude_path, const LoadConfig& config)
{
    Graph active = load_graph_from_file(include_path, false, config);
    Graph archived = load_graph_from_file(occlude_path, true, config);
    return active + archived;
}

void save_graph(
    const fs::path& include_path,
    const fs::path& occlude_path,
    const Graph& graph,
    const StorageConfig& config)
{
    const std::vector<Item> sorted = graph.topological_sort();
    const AtomicFileWriter writer(config);
    writer.write_files({
        FileWrite{include_path, render_item_file(include_path, false, sorted)},
        FileWrite{occlude_path, render_item_file(occlude_path, true, sorted)},
    });
    logger()->debug("Saved {} item(s) to {} and {}", sorted.size(), include_path.string(),
        occlude_path.string());
}

std::string show_include_structure(const fs::path& path, bool recursive)
{
    std::string out = path.string();
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        return out + " (missing)\n";
    }
    out += "\n";
    std::vector<fs::path> chain{file_identity(path)};
    render_includes(path, "", recursive, chain, out);
    return out;
}

} // namespace giantt
