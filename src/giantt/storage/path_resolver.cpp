/**
 * @file path_resolver.cpp
 */
#include "giantt/storage/path_resolver.hpp"

#include <cctype>

namespace giantt
{

namespace fs = std::filesystem;

namespace
{

bool is_separator(char c) noexcept
{
    return c == '/' || c == '\\';
}

fs::path lexical(std::string_view path)
{
    std::string text(path);
#ifdef _WIN32
    std::replace(text.begin(), text.end(), '/', '\\');
#else
    std::replace(text.begin(), text.end(), '\\', '/');
#endif
    fs::path normal = fs::path(text).lexically_normal();
    std::string result = normal.string();
    while (result.size() > 1 && is_separator(result.back()) &&
        !(result.size() == 3 && result[1] == ':'))
    {
        result.pop_back();
    }
    return result.empty() ? fs::path(".") : fs::path(result);
}

} // namespace

std::string normalize_path(std::string_view path)
{
    return lexical(path).string();
}

bool is_absolute_path(std::string_view path) noexcept
{
#ifdef _WIN32
    if (path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':' &&
        is_separator(path[2]))
    {
        return true;
    }
    return path.size() >= 2 && is_separator(path[0]) && is_separator(path[1]);
#else
    return !path.empty() && path[0] == '/';
#endif
}

fs::path resolve_path(const fs::path& base_dir, std::string_view path)
{
    if (is_absolute_path(path))
    {
        return lexical(path);
    }
    return lexical((base_dir / fs::path(std::string(path))).string());
}

std::string relative_path(const fs::path& from_dir, const fs::path& to)
{
    const fs::path from_normal = lexical(from_dir.string());
    const fs::path to_normal = lexical(to.string());
    if (from_normal == to_normal)
    {
        return ".";
    }
    const fs::path relative = to_normal.lexically_relative(from_normal);
    if (relative.empty())
    {
        return to_normal.generic_string();
    }
    return relative.generic_string();
}

std::string safe_filename(std::string_view name)
{
    static constexpr std::string_view k_reserved = "<>:\"/\\|?*";
    std::string result;
    result.reserve(name.size());
    for (char c : name)
    {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f || k_reserved.find(c) != std::string_view::npos)
        {
            continue;
        }
        result += c;
    }
    return result.empty() ? "untitled" : result;
}

} // namespace giantt
