// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// folio_upload - resumable multipart uploads against S3-compatible storage

#include <atomic>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "commands.hpp"
#include "config_parser.hpp"
#include "folio_log_init.hpp"
#include "s3_object_store.hpp"

namespace {

std::atomic<bool> g_should_exit(false);

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_should_exit.store(true);
  }
}

int run(int argc, char* argv[]) {
  std::string config_file;
  std::string cli_bucket;
  std::string cli_endpoint;
  std::string cli_region;
  bool verbose = false;

  // Global options come before the command
  int i = 1;
  for (; i < argc && argv[i][0] == '-'; ++i) {
    auto needs_value = [&](const char* name) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << name << " requires an argument" << std::endl;
        return nullptr;
      }
      return argv[++i];
    };

    if (strcmp(argv[i], "--config") == 0) {
      const char* value = needs_value("--config");
      if (!value) return 1;
      config_file = value;
    } else if (strcmp(argv[i], "--bucket") == 0) {
      const char* value = needs_value("--bucket");
      if (!value) return 1;
      cli_bucket = value;
    } else if (strcmp(argv[i], "--endpoint") == 0) {
      const char* value = needs_value("--endpoint");
      if (!value) return 1;
      cli_endpoint = value;
    } else if (strcmp(argv[i], "--region") == 0) {
      const char* value = needs_value("--region");
      if (!value) return 1;
      cli_region = value;
    } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
      verbose = true;
    } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      break;
    } else {
      std::cerr << "Error: Unknown option: " << argv[i] << std::endl;
      return 1;
    }
  }

  std::vector<std::string> command_args(argv + i, argv + argc);

  folio::cli::AppConfig config;
  folio::cli::ConfigParser parser;
  if (!config_file.empty()) {
    if (!parser.load_from_file(config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << config_file
                << "': " << parser.get_last_error() << std::endl;
      return 1;
    }
  }

  // CLI takes precedence over the config file
  if (!cli_bucket.empty()) {
    config.storage.bucket = cli_bucket;
  }
  if (!cli_endpoint.empty()) {
    config.storage.endpoint_url = cli_endpoint;
  }
  if (!cli_region.empty()) {
    config.storage.region = cli_region;
  }
  if (verbose) {
    config.logging.console_level = "debug";
  }

  folio::logging::LoggingConfig log_config;
  folio::cli::convert_logging_config(config.logging, log_config);
  folio::logging::apply_env_overrides(log_config);
  folio::logging::init_logging(log_config);

  bool wants_help = command_args.empty() || command_args[0] == "help" ||
                    command_args[0] == "--help" || command_args[0] == "-h";
  std::string error_msg;
  if (!wants_help && !folio::cli::ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    folio::logging::shutdown_logging();
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  folio::upload::S3ObjectStore store(config.storage);
  folio::cli::Commands commands(store, config);
  commands.set_verbose(verbose);
  commands.set_stop_flag(&g_should_exit);

  int rc = commands.execute(command_args);
  folio::logging::shutdown_logging();
  return rc;
}

}  // namespace

/**
 * Main entry point for folio_upload
 */
int main(int argc, char* argv[]) {
  try {
    return run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    folio::logging::shutdown_logging();
    return 1;
  }
}
