/**
 * @file logging.cpp
 */
#include "giantt/common/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace giantt
{

namespace
{

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger)
    {
        g_logger = spdlog::get(k_logger_name);
        if (!g_logger)
        {
            g_logger = spdlog::stderr_color_mt(k_logger_name);
        }
    }
    return g_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement)
{
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_logger = std::move(replacement);
}

} // namespace giantt
