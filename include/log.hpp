/**
 * @file log.hpp
 * @brief Logging setup and category loggers for issuescan.
 *
 * All loggers write to stderr so the issue listing on stdout stays
 * machine-readable. An optional file sink may rotate and gzip old files.
 */

#ifndef ISSUESCAN_LOG_HPP
#define ISSUESCAN_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace iscan {

/**
 * Initialize (or reconfigure) the default `issuescan` logger.
 *
 * The sinks are created the first time this is called. Later calls only
 * update the level and pattern.
 *
 * @param level Verbosity applied to the default logger.
 * @param pattern spdlog pattern; empty keeps the spdlog default.
 * @param file Optional log file. Empty disables file output.
 * @param rotate_files Number of rotated files to keep; 0 writes a single
 *        file that is truncated on start.
 * @param compress_rotations Gzip rotated files when rotating.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve the logger for @p category, creating it on first use.
 *
 * Category loggers are registered as `issuescan.<category>` and share the
 * sinks of the default logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/// Apply per-category level overrides.
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/// Create the default logger with info level when nobody initialized it.
void ensure_default_logger();

} // namespace iscan

#endif // ISSUESCAN_LOG_HPP
