/**
 * @file item_store.hpp
 * @brief Loading and saving item graphs from include/occlude file pairs.
 */
#pragma once
#include "giantt/common/common.hpp"
#include "giantt/graph/graph.hpp"
#include "giantt/storage/storage_config.hpp"

#include <filesystem>

namespace giantt
{

/**
 * @brief The `#include` directives at the top of an item file.
 *
 * @details
 * Directives are lines of the form `#include path`, `#include <path>` or
 * `#include "path"`. They are collected from the start of the file, skipping
 * blank lines and other comment lines (such as the banner), and collection
 * stops at the first item line. Paths are returned as written.
 *
 * A file that does not exist has no directives.
 *
 * @throw IOError if the file exists but cannot be read.
 * @throw ParseError for a directive without a path.
 */
std::vector<std::string> parse_include_directives(const std::filesystem::path& path);

/**
 * @brief Load one item file and, recursively, the files it includes.
 *
 * @details
 * Included files are loaded first, in directive order, then the file's own
 * items, so a later definition of an id replaces an earlier one. Every item
 * loaded gets `occlude` as its occluded flag.
 *
 * Invalid item lines are skipped with a warning, unless `config.strict` is
 * set, in which case the `ParseError` propagates.
 *
 * @throw GraphException (MissingFile) if the file or any included file does
 * not exist.
 * @throw GraphException (CircularInclude) if the include directives form a
 * cycle; the message names the files along it.
 * @throw IOError if a file cannot be read.
 */
Graph load_graph_from_file(
    const std::filesystem::path& path,
    bool occlude,
    const LoadConfig& config = {});

/**
 * @brief Load the active and archived items of a workspace.
 *
 * @details
 * Items from `occlude_path` (and its includes) are marked occluded. If an id
 * appears in both, the occluded definition wins. Any failure aborts the whole
 * load.
 */
Graph load_graph(
    const std::filesystem::path& include_path,
    const std::filesystem::path& occlude_path,
    const LoadConfig& config = {});

/**
 * @brief Save a graph to an include/occlude file pair in one atomic batch.
 *
 * @details
 * Each file is written as a fresh banner, the `#include` directives already
 * present in that file, and then its items (active or occluded) in
 * `Graph::topological_sort()` order. Items identical to their definition in
 * an included file are not repeated.
 *
 * @throw CycleDetected if the graph cannot be ordered.
 * @throw GraphException if an included file cannot be loaded or the write
 * batch fails; no file is modified in that case.
 */
void save_graph(
    const std::filesystem::path& include_path,
    const std::filesystem::path& occlude_path,
    const Graph& graph,
    const StorageConfig& config = {});

/**
 * @brief Render the include tree of a file as text.
 *
 * @details
 * One line per file, children indented below their parent. Missing files are
 * marked `(missing)` and files already on the current branch `(circular)`;
 * neither stops the rendering.
 *
 * @param path The root file.
 * @param recursive If false, only the root's direct includes are listed.
 */
std::string show_include_structure(const std::filesystem::path& path, bool recursive = true);

} // namespace giantt
