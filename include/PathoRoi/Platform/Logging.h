#pragma once

/**
 * @file Logging.h
 * @brief Library logger (spdlog)
 *
 * One named logger "pathoroi" writing to stderr. It is created on first use
 * and shared by all threads.
 */

#include <PathoRoi/Core/Export.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>

namespace Patho::Roi {

/// Name of the library logger
inline constexpr const char* LOGGER_NAME = "pathoroi";

/// Library logger
PATHOROI_API auto Logger() -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Set the logger level
 * @param level "trace", "debug", "info", "warn", "error", "critical" or "off"
 */
PATHOROI_API void SetLogLevel(const std::string& level);

/**
 * @brief Also write log records to a file (appended)
 *
 * Safe to call while other threads are logging.
 *
 * @throws IOException if the file cannot be opened
 */
PATHOROI_API void AddLogFile(const std::filesystem::path& path);

} // namespace Patho::Roi
