// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_LOG_INIT_HPP
#define FOLIO_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "folio_console_sink.hpp"
#include "folio_file_sink.hpp"
#include "folio_log_severity.hpp"

namespace folio {
namespace logging {

/**
 * Logging configuration for folio applications.
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
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (case-insensitive).
 *
 * @return The parsed level, or std::nullopt if the string is not a level name
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   FOLIO_LOG_LEVEL           - Global level (overrides both console and file)
 *   FOLIO_LOG_CONSOLE_LEVEL   - Console sink level
 *   FOLIO_LOG_FILE_LEVEL      - File sink level
 *   FOLIO_LOG_FILE_DIR        - Log file directory
 *   FOLIO_LOG_FORMAT          - File format ("json" or "text")
 *   FOLIO_LOG_FILE_ENABLED    - Enable file logging ("true" or "false")
 *   FOLIO_LOG_CONSOLE_ENABLED - Enable console logging ("true" or "false")
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the console and file sinks. Calling it again before
 * shutdown_logging() is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO with colors, no file sink.
 */
void init_logging_default();

/**
 * Stop async sink threads, drain pending records and detach all sinks.
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

bool is_logging_initialized();

}  // namespace logging
}  // namespace folio

#endif  // FOLIO_LOG_INIT_HPP
