/**
 * @file logging.hpp
 * @brief Access to the library-wide spdlog logger.
 */
#pragma once
#include "giantt/common/common.hpp"

#include <spdlog/spdlog.h>

namespace giantt
{

/**
 * @brief Name under which the library logger is registered with spdlog.
 */
inline constexpr const char* k_logger_name = "giantt";

/**
 * @brief Get the library logger.
 *
 * @details
 * The logger is created on first use with a colored stderr sink and
 * registered with spdlog under `k_logger_name`, so `SPDLOG_LEVEL=giantt=debug`
 * style environment configuration applies to it. A logger installed with
 * `set_logger()` takes precedence.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Replace the library logger (for example with a file or null sink).
 * @param replacement The new logger; passing nullptr restores the default.
 */
void set_logger(std::shared_ptr<spdlog::logger> replacement);

} // namespace giantt
