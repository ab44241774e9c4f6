// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_LOG_INIT_HPP
#define HOIST_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include "hoist_console_sink.hpp"
#include "hoist_file_sink.hpp"
#include "hoist_log_severity.hpp"

namespace hoist {
namespace logging {

/**
 * Resolved logging configuration: levels are enums and the file sink is
 * fully described. Built from LogSettings by resolve_logging_config().
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Logging settings as written in the "logging:" section of hoist.yaml.
 *
 * Levels and the file format are still text here; they are checked when
 * the settings are resolved.
 */
struct LogSettings {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/hoist";
  std::string file_format = "json";  // "json" or "text"
  int max_files = 10;
  uint64_t rotation_size_mb = 100;

  // --verbose: console at debug whatever console_level says
  bool verbose = false;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (case-insensitive).
 *
 * @return The parsed level, or std::nullopt if the string is not a level name
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Turn @p settings into a LoggingConfig.
 *
 * Environment overrides are not applied here.
 *
 * @param error_msg Set to a description of the first invalid field
 * @return The config, or std::nullopt if a level, the format or a file limit is invalid
 */
std::optional<LoggingConfig> resolve_logging_config(
  const LogSettings& settings, std::string& error_msg
);

/**
 * Apply environment variable overrides in place.
 *
 *   HOIST_LOG_LEVEL           - level for both sinks
 *   HOIST_LOG_CONSOLE_LEVEL   - console sink level
 *   HOIST_LOG_FILE_LEVEL      - file sink level
 *   HOIST_LOG_FILE_DIR        - log file directory
 *   HOIST_LOG_FORMAT          - file format ("json" or "text")
 *   HOIST_LOG_FILE_ENABLED    - "true"/"false"
 *   HOIST_LOG_CONSOLE_ENABLED - "true"/"false"
 *
 * Values that do not parse are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. Calling it twice is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Resolve @p settings, apply environment overrides and install the sinks.
 *
 * @return false with @p error_msg set if the settings do not resolve;
 *         logging is left untouched in that case
 */
bool init_logging(const LogSettings& settings, std::string& error_msg);

/**
 * Console at INFO with colors, no file sink.
 */
void init_logging_default();

/**
 * Stop async sink threads, flush pending records and detach all sinks.
 */
void shutdown_logging();

/**
 * Attach an extra sink. It is detached again by shutdown_logging().
 */
void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Shut down and reinitialize with @p config plus environment overrides.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace hoist

#endif  // HOIST_LOG_INIT_HPP
