// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "expiry_reaper.hpp"
#include "file_signature.hpp"
#include "object_key.hpp"

namespace folio {
namespace cli {

namespace {

bool parse_uint(const std::string& text, uint64_t& value) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    value = std::stoull(text);
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

}  // namespace

Commands::Commands(
  upload::IObjectStore& store, const AppConfig& config, std::ostream& out, std::ostream& err
)
    : store_(store)
    , config_(config)
    , coordinator_(store, config.upload.default_chunk_size)
    , out_(out)
    , err_(err) {}

int Commands::signature(const std::string& path) {
  auto info = upload::inspectLocalFile(path);
  if (!info) {
    return fail(info.error());
  }

  out_ << info.value().signature << std::endl;
  if (verbose_) {
    out_ << "Name: " << info.value().name << std::endl;
    out_ << "Size: " << info.value().size << " bytes" << std::endl;
    out_ << "Modified: " << info.value().last_modified_ms << " ms" << std::endl;
  }
  return 0;
}

int Commands::push(const std::string& path) {
  FileUploader uploader(coordinator_, config_.retry.toRetryConfig(), sleeper_);
  if (verbose_) {
    uploader.setProgressCallback([this](uint64_t done, uint64_t total) {
      out_ << "Progress: " << done << "/" << total << " chunks" << std::endl;
    });
  }

  auto result = uploader.push(path);
  if (!result) {
    return fail(result.error());
  }

  const PushOutcome& outcome = result.value();
  if (outcome.already_completed) {
    out_ << "Already uploaded: " << outcome.completed.key << std::endl;
    return 0;
  }

  if (outcome.resumed) {
    out_ << "Resumed upload (" << outcome.chunks_skipped << " chunks already stored)" << std::endl;
  }
  out_ << "Uploaded: " << outcome.completed.key << std::endl;
  out_ << "Location: " << outcome.completed.location << std::endl;
  if (verbose_) {
    out_ << "ETag: " << outcome.completed.etag << std::endl;
    out_ << "Chunks sent: " << outcome.chunks_sent << ", retries: " << outcome.retries
         << std::endl;
  }
  return 0;
}

int Commands::init(
  const std::string& signature, const std::string& file_name, const std::string& size
) {
  uint64_t file_size = 0;
  if (!parse_uint(size, file_size)) {
    return usage_error("Invalid file size '" + size + "'");
  }

  auto result = coordinator_.initOrResume(signature, file_name, file_size);
  if (!result) {
    return fail(result.error());
  }

  const upload::InitResult& session = result.value();
  out_ << "Upload ID: " << session.upload_id << std::endl;
  out_ << "Key: " << session.key << std::endl;
  out_ << "Chunk size: " << session.chunk_size << std::endl;
  out_ << "Total chunks: " << session.total_chunks << std::endl;
  out_ << "Completed chunks: " << session.completed_chunks << std::endl;
  out_ << "Resume: " << (session.is_resume ? "yes" : "no") << std::endl;
  return 0;
}

int Commands::put(
  const std::string& upload_id, const std::string& key, const std::string& part_number,
  const std::string& chunk_path
) {
  uint64_t part = 0;
  if (!parse_uint(part_number, part) || part > static_cast<uint64_t>(upload::kMaxPartCount)) {
    return usage_error("Invalid part number '" + part_number + "'");
  }

  std::ifstream file(chunk_path, std::ios::binary);
  if (!file) {
    err_ << "Error: Cannot open " << chunk_path << std::endl;
    return 1;
  }
  std::vector<uint8_t> bytes(
    (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>()
  );

  auto etag = coordinator_.uploadPart(upload_id, key, static_cast<int>(part), bytes);
  if (!etag) {
    return fail(etag.error());
  }
  out_ << "ETag: " << etag.value() << std::endl;
  return 0;
}

int Commands::complete(const std::string& upload_id, const std::string& key) {
  auto result = coordinator_.complete(upload_id, key);
  if (!result) {
    return fail(result.error());
  }
  out_ << "Completed: " << result.value().key << std::endl;
  out_ << "Location: " << result.value().location << std::endl;
  return 0;
}

int Commands::abort(const std::string& upload_id, const std::string& key) {
  auto result = coordinator_.abort(upload_id, key);
  if (!result) {
    return fail(result.error());
  }
  out_ << "Aborted: " << upload_id << std::endl;
  return 0;
}

int Commands::list() {
  auto result = coordinator_.listPending();
  if (!result) {
    return fail(result.error());
  }

  const auto& pending = result.value();
  if (pending.empty()) {
    out_ << "No pending uploads." << std::endl;
    return 0;
  }

  for (const auto& summary : pending) {
    out_ << summary.upload_id << "  " << summary.file_name << "  " << summary.completed_chunks
         << " chunks (" << format_size(summary.bytes_uploaded) << ")  "
         << format_time(summary.created_at) << std::endl;
    if (verbose_) {
      out_ << "    key: " << summary.key << std::endl;
    }
  }
  out_ << pending.size() << " pending upload(s)" << std::endl;
  return 0;
}

int Commands::status(const std::string& upload_id) {
  auto result = coordinator_.status(upload_id);
  if (!result) {
    return fail(result.error());
  }

  const auto& summary = result.value();
  out_ << "Upload ID: " << summary.upload_id << std::endl;
  out_ << "Key: " << summary.key << std::endl;
  out_ << "File: " << summary.file_name << std::endl;
  out_ << "Signature: " << summary.signature << std::endl;
  out_ << "Completed chunks: " << summary.completed_chunks << std::endl;
  out_ << "Uploaded: " << format_size(summary.bytes_uploaded) << std::endl;
  out_ << "Started: " << format_time(summary.created_at) << std::endl;
  return 0;
}

int Commands::cleanup(const std::string& hours) {
  upload::ReaperConfig reaper_config = config_.reaper.toReaperConfig();
  if (!hours.empty()) {
    uint64_t value = 0;
    if (!parse_uint(hours, value) || value == 0 ||
        value > static_cast<uint64_t>(upload::kMaxSessionAge.count())) {
      return usage_error(
        "Invalid age '" + hours + "' (1.." + std::to_string(upload::kMaxSessionAge.count()) +
        " hours)"
      );
    }
    reaper_config.max_age = std::chrono::hours(value);
  }

  upload::ExpiryReaper reaper(store_, reaper_config);
  auto result = reaper.sweep();
  if (!result) {
    return fail(result.error());
  }
  out_ << "Aborted " << result.value() << " expired upload(s)" << std::endl;
  return 0;
}

int Commands::url(const std::string& key, const std::string& seconds) {
  std::chrono::seconds ttl(config_.upload.url_ttl_seconds);
  if (!seconds.empty()) {
    uint64_t value = 0;
    if (!parse_uint(seconds, value)) {
      return usage_error("Invalid expiry '" + seconds + "'");
    }
    ttl = std::chrono::seconds(value);
  }

  auto result = coordinator_.downloadUrl(key, ttl);
  if (!result) {
    return fail(result.error());
  }
  out_ << result.value() << std::endl;
  return 0;
}

int Commands::reap() {
  upload::ExpiryReaper reaper(store_, config_.reaper.toReaperConfig());
  reaper.start();
  out_ << "Reaper running (max age " << config_.reaper.max_age_hours << "h, every "
       << config_.reaper.interval_minutes << " min)" << std::endl;

  while (stop_flag_ == nullptr || !stop_flag_->load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  reaper.stop();
  out_ << "Reaper stopped after " << reaper.sweepCount() << " sweep(s), "
       << reaper.totalAborted() << " upload(s) aborted" << std::endl;
  return 0;
}

int Commands::execute(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return execute(args);
}

int Commands::execute(const std::vector<std::string>& args) {
  std::vector<std::string> positional;
  for (const auto& arg : args) {
    if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    print_usage();
    return 0;
  }

  const std::string& command = positional[0];
  auto arg = [&positional](size_t i) {
    return i < positional.size() ? positional[i] : std::string();
  };
  auto need = [&](size_t count) {
    return positional.size() >= count + 1;
  };

  if (command == "help" || command == "--help" || command == "-h") {
    print_usage();
    return 0;
  } else if (command == "signature") {
    return need(1) ? signature(arg(1)) : usage_error("signature requires <file>");
  } else if (command == "push") {
    return need(1) ? push(arg(1)) : usage_error("push requires <file>");
  } else if (command == "init") {
    return need(3) ? init(arg(1), arg(2), arg(3))
                   : usage_error("init requires <signature> <file_name> <size>");
  } else if (command == "put") {
    return need(4) ? put(arg(1), arg(2), arg(3), arg(4))
                   : usage_error("put requires <upload_id> <key> <part_number> <chunk_file>");
  } else if (command == "complete") {
    return need(2) ? complete(arg(1), arg(2)) : usage_error("complete requires <upload_id> <key>");
  } else if (command == "abort") {
    return need(2) ? abort(arg(1), arg(2)) : usage_error("abort requires <upload_id> <key>");
  } else if (command == "list") {
    return list();
  } else if (command == "status") {
    return need(1) ? status(arg(1)) : usage_error("status requires <upload_id>");
  } else if (command == "cleanup") {
    return cleanup(arg(1));
  } else if (command == "url") {
    return need(1) ? url(arg(1), arg(2)) : usage_error("url requires <key>");
  } else if (command == "reap") {
    return reap();
  } else {
    err_ << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }
}

int Commands::fail(const upload::UploadError& error) {
  err_ << "Error: " << error.describe() << std::endl;
  return 1;
}

int Commands::usage_error(const std::string& message) {
  err_ << "Error: " << message << std::endl;
  return 1;
}

std::string Commands::format_size(uint64_t size) {
  const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit_index = 0;

  while (size >= 1024 && unit_index < 4) {
    size /= 1024;
    unit_index++;
  }

  std::ostringstream oss;
  oss << size << " " << units[unit_index];
  return oss.str();
}

std::string Commands::format_time(std::chrono::system_clock::time_point time) {
  std::time_t t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buffer[64];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &tm);
  return buffer;
}

void Commands::print_usage() {
  out_ << "Usage: folio_upload [--config <file>] [--bucket <name>] [--endpoint <url>]" << std::endl;
  out_ << "                    [--region <region>] [--verbose] <command> [args]" << std::endl;
  out_ << std::endl;
  out_ << "Commands:" << std::endl;
  out_ << "  signature <file>                     Print the resume signature of a file" << std::endl;
  out_ << "  push <file>                          Upload a file, resuming if possible" << std::endl;
  out_ << "  init <signature> <name> <size>       Start or resume an upload session" << std::endl;
  out_ << "  put <upload_id> <key> <part> <file>  Upload one part" << std::endl;
  out_ << "  complete <upload_id> <key>           Assemble the uploaded parts" << std::endl;
  out_ << "  abort <upload_id> <key>              Discard an upload session" << std::endl;
  out_ << "  list                                 List pending uploads" << std::endl;
  out_ << "  status <upload_id>                   Show progress of one upload" << std::endl;
  out_ << "  cleanup [hours]                      Abort uploads older than hours" << std::endl;
  out_ << "  url <key> [seconds]                  Print a presigned download URL" << std::endl;
  out_ << "  reap                                 Abort expired uploads periodically" << std::endl;
  out_ << "  help                                 Show this help message" << std::endl;
}

}  // namespace cli
}  // namespace folio
