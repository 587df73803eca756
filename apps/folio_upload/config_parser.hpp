// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_UPLOAD_CONFIG_PARSER_HPP
#define FOLIO_UPLOAD_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <vector>

#include "expiry_reaper.hpp"
#include "retry_handler.hpp"
#include "s3_object_store.hpp"
#include "upload_limits.hpp"

namespace folio {
namespace logging {
struct LoggingConfig;
}
}  // namespace folio

namespace folio {
namespace cli {

/**
 * Logging section as written in YAML; levels stay strings until
 * convert_logging_config()
 */
struct LoggingSection {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/folio";
  std::string file_pattern = "folio_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";
  size_t rotation_size_mb = 100;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

struct UploadSection {
  uint64_t default_chunk_size = upload::kDefaultChunkSize;
  int url_ttl_seconds = static_cast<int>(upload::kDefaultUrlTtl.count());
};

struct ReaperSection {
  int max_age_hours = static_cast<int>(upload::kDefaultMaxSessionAge.count());
  int interval_minutes = static_cast<int>(upload::kDefaultSweepInterval.count());

  upload::ReaperConfig toReaperConfig() const;
};

struct RetrySection {
  int max_retries = 5;
  int initial_delay_ms = 500;
  int max_delay_ms = 30000;
  double exponential_base = 2.0;
  bool jitter = true;

  upload::RetryConfig toRetryConfig() const;
};

/**
 * Everything folio_upload reads from its config file
 */
struct AppConfig {
  upload::S3Config storage;
  UploadSection upload;
  ReaperSection reaper;
  RetrySection retry;
  LoggingSection logging;
};

/**
 * Copy the YAML logging section into the logging library's config.
 * Unknown level names keep the library default.
 */
void convert_logging_config(const LoggingSection& section, ::folio::logging::LoggingConfig& config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from a YAML file, substituting environment variables
   */
  bool load_from_file(const std::string& path, AppConfig& config);

  /**
   * Load configuration from YAML text, substituting environment variables
   */
  bool load_from_string(const std::string& yaml_content, AppConfig& config);

  /**
   * Check required fields and backend limits
   */
  static bool validate(const AppConfig& config, std::string& error_msg);

  /**
   * Replace ${VAR} and ${VAR:-default} with environment values.
   *
   * An unset variable without a default becomes empty and its name is
   * appended to missing (if given).
   */
  static std::string substitute_env(
    const std::string& text, std::vector<std::string>* missing = nullptr
  );

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_storage(const YAML::Node& node, upload::S3Config& storage);
  bool parse_upload(const YAML::Node& node, UploadSection& upload);
  bool parse_reaper(const YAML::Node& node, ReaperSection& reaper);
  bool parse_retry(const YAML::Node& node, RetrySection& retry);
  bool parse_logging(const YAML::Node& node, LoggingSection& logging);

  mutable std::string last_error_;
};

}  // namespace cli
}  // namespace folio

#endif  // FOLIO_UPLOAD_CONFIG_PARSER_HPP
