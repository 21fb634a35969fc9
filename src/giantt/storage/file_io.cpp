/**
 * @file file_io.cpp
 */
#include "giantt/storage/file_io.hpp"
#include "giantt/common/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace giantt
{

std::string read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw IOError("Cannot open '" + path.string() + "' for reading: " + std::strerror(errno));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
    {
        throw IOError("Failed reading '" + path.string() + "'");
    }
    return buffer.str();
}

void write_text_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw IOError("Cannot open '" + path.string() + "' for writing: " + std::strerror(errno));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out)
    {
        throw IOError("Failed writing '" + path.string() + "'");
    }
}

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string::npos)
        {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

} // namespace giantt
