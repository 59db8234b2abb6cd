#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace loom {
namespace log {

/**
 * @brief Library logger named "loom"
 *
 * Created on first use with a stderr sink at warn level, so the library is
 * quiet unless configured. init_log() replaces it with a file logger.
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Send library logs to a file
 *
 * The file is truncated, parent directories are created, and the logger is
 * also installed as the spdlog default logger.
 *
 * @param path Log file path
 * @param level One of trace, debug, info, warn, error, critical, off
 * @return InvalidConfig if the level is unknown or the file cannot be opened
 */
Expected<void> init_log(const std::string& path, const std::string& level = "info");

/**
 * @brief Change the level of the library logger
 *
 * @return InvalidConfig if the level name is unknown
 */
Expected<void> set_level(const std::string& level);

} // namespace log
} // namespace loom
