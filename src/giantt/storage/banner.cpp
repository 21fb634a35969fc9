/**
 * @file banner.cpp
 */
#include "giantt/storage/banner.hpp"

namespace giantt
{

namespace
{

// Width in code points, so UTF-8 text lines up with ASCII borders.
size_t display_width(const std::string& text)
{
    size_t width = 0;
    for (char c : text)
    {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
        {
            ++width;
        }
    }
    return width;
}

std::string schema_line(const char* kind)
{
    return std::string("Schema: giantt-") + kind + " v" + std::to_string(k_schema_version);
}

} // namespace

std::string create_banner(const std::vector<std::string>& lines, size_t padding_h, size_t padding_v)
{
    size_t max_width = 0;
    for (const auto& line : lines)
    {
        max_width = std::max(max_width, display_width(line));
    }
    const size_t inner = max_width + 2 * padding_h;
    const std::string border(inner + 2, '#');
    const std::string empty_row = "#" + std::string(inner, ' ') + "#";

    std::string banner = border + "\n";
    for (size_t i = 0; i < padding_v; ++i)
    {
        banner += empty_row + "\n";
    }
    for (const auto& line : lines)
    {
        const size_t width = display_width(line);
        const size_t left = (inner - width) / 2;
        const size_t right = inner - width - left;
        banner += "#" + std::string(left, ' ') + line + std::string(right, ' ') + "#\n";
    }
    for (size_t i = 0; i < padding_v; ++i)
    {
        banner += empty_row + "\n";
    }
    banner += border + "\n";
    return banner;
}

std::string items_banner(bool occluded)
{
    if (occluded)
    {
        return create_banner({
            "Giantt Occluded Items",
            "This file holds archived items.",
            "They are loaded for reference but hidden from active views.",
            schema_line("items"),
        });
    }
    return create_banner({
        "Giantt Items",
        "This file holds active items in topological order",
        "of their REQUIRES and ANYOF relations.",
        "Place #include directives directly below this banner",
        "to pull in items from other files.",
        schema_line("items"),
    });
}

std::string logs_banner(bool occluded)
{
    if (occluded)
    {
        return create_banner({
            "Giantt Occluded Logs",
            "This file holds archived log entries, one JSON object per line.",
            schema_line("logs"),
        });
    }
    return create_banner({
        "Giantt Logs",
        "This file holds log entries, one JSON object per line.",
        schema_line("logs"),
    });
}

std::string metadata_banner(bool occluded)
{
    return create_banner({
        occluded ? "Giantt Occluded Metadata" : "Giantt Metadata",
        "Lines starting with # are ignored when the JSON body is read.",
        schema_line("metadata"),
    });
}

} // namespace giantt
