// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>

#define FOLIO_LOG_COMPONENT "config_parser"
#include <folio_log_init.hpp>
#include <folio_log_macros.hpp>

namespace folio {
namespace cli {

upload::ReaperConfig ReaperSection::toReaperConfig() const {
  upload::ReaperConfig config;
  config.max_age = std::chrono::hours(max_age_hours);
  config.interval = std::chrono::minutes(interval_minutes);
  return config;
}

upload::RetryConfig RetrySection::toRetryConfig() const {
  upload::RetryConfig config;
  config.max_retries = max_retries;
  config.initial_delay = std::chrono::milliseconds(initial_delay_ms);
  config.max_delay = std::chrono::milliseconds(max_delay_ms);
  config.exponential_base = exponential_base;
  config.jitter = jitter;
  return config;
}

// ============================================================================
// Environment substitution
// ============================================================================

std::string ConfigParser::substitute_env(const std::string& text, std::vector<std::string>* missing) {
  std::string out;
  out.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    size_t start = text.find("${", pos);
    if (start == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    size_t end = text.find('}', start + 2);
    if (end == std::string::npos) {
      // Unterminated reference stays as written
      out.append(text, pos, std::string::npos);
      break;
    }

    out.append(text, pos, start - pos);
    std::string expr = text.substr(start + 2, end - start - 2);
    std::string name = expr;
    std::string fallback;
    bool has_default = false;
    size_t sep = expr.find(":-");
    if (sep != std::string::npos) {
      name = expr.substr(0, sep);
      fallback = expr.substr(sep + 2);
      has_default = true;
    }

    const char* value = std::getenv(name.c_str());
    if (value && *value) {
      out += value;
    } else if (has_default) {
      out += fallback;
    } else if (missing) {
      missing->push_back(name);
    }
    pos = end + 1;
  }
  return out;
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, AppConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str(), config);
}

bool ConfigParser::load_from_string(const std::string& yaml_content, AppConfig& config) {
  std::vector<std::string> missing;
  std::string expanded = substitute_env(yaml_content, &missing);
  for (const auto& name : missing) {
    FOLIO_LOG_WARN("Environment variable not set, using empty value" << ::folio::logging::kv("var", name));
  }

  try {
    YAML::Node node = YAML::Load(expanded);

    if (node["storage"] && !parse_storage(node["storage"], config.storage)) {
      return false;
    }
    if (node["upload"] && !parse_upload(node["upload"], config.upload)) {
      return false;
    }
    if (node["reaper"] && !parse_reaper(node["reaper"], config.reaper)) {
      return false;
    }
    if (node["retry"] && !parse_retry(node["retry"], config.retry)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_storage(const YAML::Node& node, upload::S3Config& storage) {
  if (!node.IsMap()) {
    last_error_ = "storage must be a mapping";
    return false;
  }
  if (node["endpoint_url"]) {
    storage.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["bucket"]) {
    storage.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    storage.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    storage.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    storage.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    storage.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    storage.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    storage.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    storage.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_sdk_retries"]) {
    storage.max_sdk_retries = node["max_sdk_retries"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_upload(const YAML::Node& node, UploadSection& upload) {
  if (node["default_chunk_size"]) {
    upload.default_chunk_size = node["default_chunk_size"].as<uint64_t>();
  }
  if (node["url_ttl_seconds"]) {
    upload.url_ttl_seconds = node["url_ttl_seconds"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_reaper(const YAML::Node& node, ReaperSection& reaper) {
  if (node["max_age_hours"]) {
    reaper.max_age_hours = node["max_age_hours"].as<int>();
  }
  if (node["interval_minutes"]) {
    reaper.interval_minutes = node["interval_minutes"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetrySection& retry) {
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay_ms = node["initial_delay_ms"].as<int>();
  }
  if (node["max_delay_ms"]) {
    retry.max_delay_ms = node["max_delay_ms"].as<int>();
  }
  if (node["exponential_base"]) {
    retry.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSection& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
  return true;
}

bool ConfigParser::validate(const AppConfig& config, std::string& error_msg) {
  if (config.storage.bucket.empty()) {
    error_msg = "storage.bucket is not configured";
    return false;
  }

  if (!config.storage.endpoint_url.empty() &&
      config.storage.endpoint_url.find("http://") != 0 &&
      config.storage.endpoint_url.find("https://") != 0) {
    error_msg = "Invalid storage.endpoint_url - must start with http:// or https://";
    return false;
  }

  if (config.upload.default_chunk_size < upload::kMinPartSize ||
      config.upload.default_chunk_size > upload::kMaxPartSize) {
    error_msg = "Invalid upload.default_chunk_size - must be between 5 MiB and 5 GiB";
    return false;
  }

  if (config.upload.url_ttl_seconds <= 0 || config.upload.url_ttl_seconds > 7 * 24 * 3600) {
    error_msg = "Invalid upload.url_ttl_seconds - must be between 1 and 604800";
    return false;
  }

  if (config.reaper.max_age_hours <= 0 ||
      config.reaper.max_age_hours > upload::kMaxSessionAge.count()) {
    error_msg = "Invalid reaper.max_age_hours - must be between 1 and " +
                std::to_string(upload::kMaxSessionAge.count());
    return false;
  }

  if (config.reaper.interval_minutes <= 0) {
    error_msg = "Invalid reaper.interval_minutes - must be > 0";
    return false;
  }

  if (config.retry.max_retries < 0 || config.retry.max_retries > 100) {
    error_msg = "Invalid retry.max_retries - must be between 0 and 100";
    return false;
  }

  if (config.retry.initial_delay_ms < 0) {
    error_msg = "Invalid retry.initial_delay_ms - must be >= 0";
    return false;
  }

  if (config.retry.max_delay_ms < config.retry.initial_delay_ms) {
    error_msg = "Invalid retry.max_delay_ms - must be >= initial_delay_ms";
    return false;
  }

  return true;
}

void convert_logging_config(const LoggingSection& section, ::folio::logging::LoggingConfig& config) {
  config.console_enabled = section.console_enabled;
  config.console_colors = section.console_colors;
  if (auto level = ::folio::logging::parse_severity_level(section.console_level)) {
    config.console_level = *level;
  }

  config.file_enabled = section.file_enabled;
  if (auto level = ::folio::logging::parse_severity_level(section.file_level)) {
    config.file_level = *level;
  }

  config.file_config.directory = section.file_directory;
  config.file_config.file_pattern = section.file_pattern;
  config.file_config.rotation_size_mb = section.rotation_size_mb;
  config.file_config.max_files = static_cast<int>(section.max_files);
  config.file_config.rotate_at_midnight = section.rotate_at_midnight;
  config.file_config.format_json = section.file_format != "text";
}

}  // namespace cli
}  // namespace folio
