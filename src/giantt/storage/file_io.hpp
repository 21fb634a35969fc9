/**
 * @file file_io.hpp
 */
#pragma once
#include "giantt/common/common.hpp"

#include <filesystem>

namespace giantt
{

/**
 * @brief Read a whole file as bytes.
 * @throw IOError if the file cannot be opened or read.
 */
std::string read_text_file(const std::filesystem::path& path);

/**
 * @brief Write a whole file, truncating any previous content.
 * @throw IOError if the file cannot be opened or written.
 */
void write_text_file(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Split text into lines on LF, dropping a trailing CR from each line.
 *
 * @details
 * A final line terminator does not produce an empty trailing line.
 */
std::vector<std::string> split_lines(const std::string& text);

} // namespace giantt
