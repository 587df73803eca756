// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_UPLOAD_COMMANDS_HPP
#define FOLIO_UPLOAD_COMMANDS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "config_parser.hpp"
#include "file_uploader.hpp"
#include "object_store.hpp"
#include "upload_coordinator.hpp"

namespace folio {
namespace cli {

/**
 * Command handler for folio_upload CLI
 */
class Commands {
public:
  Commands(
    upload::IObjectStore& store, const AppConfig& config, std::ostream& out = std::cout,
    std::ostream& err = std::cerr
  );
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

  /**
   * Flag polled by long-running commands (reap); set from a signal handler
   */
  void set_stop_flag(const std::atomic<bool>* flag) {
    stop_flag_ = flag;
  }

  /**
   * Replace the retry backoff sleep (tests use a no-op)
   */
  void set_sleeper(FileUploader::Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
  }

  /**
   * Print the resume signature of a local file
   */
  int signature(const std::string& path);

  /**
   * Upload a local file, resuming a previous attempt when one exists
   */
  int push(const std::string& path);

  /**
   * Start or resume a session for (signature, name, size)
   */
  int init(const std::string& signature, const std::string& file_name, const std::string& size);

  /**
   * Upload the contents of chunk_path as one part
   */
  int put(
    const std::string& upload_id, const std::string& key, const std::string& part_number,
    const std::string& chunk_path
  );

  int complete(const std::string& upload_id, const std::string& key);

  int abort(const std::string& upload_id, const std::string& key);

  /**
   * Print all pending sessions, newest first
   */
  int list();

  int status(const std::string& upload_id);

  /**
   * Abort sessions older than the given age (config value when empty)
   */
  int cleanup(const std::string& hours);

  /**
   * Print a presigned download URL
   */
  int url(const std::string& key, const std::string& seconds);

  /**
   * Run the expiry reaper until the stop flag is set
   */
  int reap();

  /**
   * Parse and execute command line; argv[0] is the program name
   */
  int execute(int argc, char* argv[]);

  /**
   * Same as execute() with the arguments after the program name
   */
  int execute(const std::vector<std::string>& args);

  void print_usage();

  static std::string format_size(uint64_t size);

  static std::string format_time(std::chrono::system_clock::time_point time);

private:
  int fail(const upload::UploadError& error);
  int usage_error(const std::string& message);

  upload::IObjectStore& store_;
  const AppConfig& config_;
  upload::UploadCoordinator coordinator_;
  std::ostream& out_;
  std::ostream& err_;
  bool verbose_ = false;
  const std::atomic<bool>* stop_flag_ = nullptr;
  FileUploader::Sleeper sleeper_;
};

}  // namespace cli
}  // namespace folio

#endif  // FOLIO_UPLOAD_COMMANDS_HPP
