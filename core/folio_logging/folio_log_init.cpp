// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "folio_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <utility>
#include <vector>

#include "folio_log_macros.hpp"

namespace folio {
namespace logging {

namespace {

/**
 * Sinks attached to the Boost.Log core by this library
 */
struct SinkRegistry {
  std::mutex mutex;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> attached;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool initialized = false;

  void attach(const boost::shared_ptr<boost::log::sinks::sink>& sink) {
    boost::log::core::get()->add_sink(sink);
    attached.push_back(sink);
  }
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Empty variables count as unset
const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

std::optional<bool> parse_flag(const std::string& s) {
  std::string lower = lowercase(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

void override_level(const char* var, severity_level& target) {
  if (const char* value = env_value(var)) {
    if (auto level = parse_severity_level(value)) {
      target = *level;
    }
  }
}

void override_flag(const char* var, bool& target) {
  if (const char* value = env_value(var)) {
    if (auto flag = parse_flag(value)) {
      target = *flag;
    }
  }
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  static const std::pair<const char*, severity_level> kNames[] = {
    {"debug", severity_level::debug},
    {"info", severity_level::info},
    {"warn", severity_level::warn},
    {"warning", severity_level::warn},
    {"error", severity_level::error},
    {"fatal", severity_level::fatal},
  };

  std::string lower = lowercase(level_str);
  for (const auto& entry : kNames) {
    if (lower == entry.first) {
      return entry.second;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  // Global level first so the per-sink variables can refine it
  override_level("FOLIO_LOG_LEVEL", config.console_level);
  override_level("FOLIO_LOG_LEVEL", config.file_level);
  override_level("FOLIO_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("FOLIO_LOG_FILE_LEVEL", config.file_level);

  override_flag("FOLIO_LOG_CONSOLE_ENABLED", config.console_enabled);
  override_flag("FOLIO_LOG_FILE_ENABLED", config.file_enabled);

  if (const char* dir = env_value("FOLIO_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
  }
  if (const char* format = env_value("FOLIO_LOG_FORMAT")) {
    config.file_config.format_json = lowercase(format) == "json";
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.initialized) {
    return;
  }

  boost::log::add_common_attributes();

  if (config.console_enabled) {
    sinks.console = create_console_sink(config.console_level, config.console_colors);
    sinks.attach(sinks.console);
  }
  if (config.file_enabled) {
    sinks.file = create_file_sink(config.file_config, config.file_level);
    sinks.attach(sinks.file);
  }

  sinks.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (!sinks.initialized) {
    return;
  }

  // stop() ends the feeding thread; flush() then drains what is queued
  if (sinks.console) {
    sinks.console->stop();
    sinks.console->flush();
  }
  if (sinks.file) {
    sinks.file->stop();
    sinks.file->flush();
  }

  auto core = boost::log::core::get();
  for (const auto& sink : sinks.attached) {
    core->remove_sink(sink);
  }
  sinks.attached.clear();
  sinks.console.reset();
  sinks.file.reset();
  sinks.initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  sinks.attach(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  boost::log::core::get()->remove_sink(sink);
  sinks.attached.erase(
    std::remove(sinks.attached.begin(), sinks.attached.end(), sink), sinks.attached.end()
  );
}

void flush_logging() {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.console) {
    sinks.console->flush();
  }
  if (sinks.file) {
    sinks.file->flush();
  }
}

bool is_logging_initialized() {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  return sinks.initialized;
}

}  // namespace logging
}  // namespace folio
