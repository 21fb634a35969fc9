#include "giantt/common/errors.hpp"
#include "giantt/common/logging.hpp"
#include "giantt/doctor/graph_doctor.hpp"
#include "giantt/parser/item_parser.hpp"
#include "giantt/storage/item_store.hpp"
#include "giantt/storage/workspace.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <spdlog/cfg/env.h>

int main(int argc, char** argv)
{
    spdlog::cfg::load_env_levels();
    try
    {
        std::filesystem::path base;
        if (argc > 1)
        {
            base = argv[1];
        }
        else if (auto found = giantt::find_workspace(std::filesystem::current_path()))
        {
            base = *found;
        }
        else
        {
            std::cerr << "usage: giantt_check [workspace-dir]\n"
                      << "No " << giantt::k_workspace_dir_name
                      << " directory found above the current directory.\n";
            return EXIT_FAILURE;
        }

        giantt::validate_workspace(base);
        const auto paths = giantt::WorkspacePaths::for_base(base);
        giantt::Graph graph = giantt::load_graph(paths.include_items, paths.occlude_items);

        std::cout << "\n\n====== " << paths.include_items.string() << " ======\n";
        std::cout << giantt::show_include_structure(paths.include_items);

        std::cout << "\n\n====== items (" << graph.size() << ") ======\n";
        for (const auto& item : graph.topological_sort())
        {
            std::cout << giantt::serialize_item(item) << "\n";
        }

        giantt::GraphDoctor doctor(graph);
        const auto issues = doctor.full_diagnosis();
        std::cout << "\n\n====== issues (" << issues.size() << ") ======\n";
        for (const auto& issue : issues)
        {
            std::cout << giantt::issue_type_name(issue.type) << "  " << issue.item_id << ": "
                      << issue.message << "\n";
        }
        std::cout << std::flush;
        return issues.empty() ? EXIT_SUCCESS : 2;
    }
    catch (const giantt::GianttError& e)
    {
        giantt::logger()->error("{}", e.what());
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        giantt::logger()->error("Unexpected error: {}", e.what());
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
}
