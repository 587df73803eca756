// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_FILE_UPLOADER_HPP
#define FOLIO_FILE_UPLOADER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "retry_handler.hpp"
#include "upload_coordinator.hpp"
#include "upload_errors.hpp"

namespace folio {
namespace cli {

/**
 * Outcome of pushing one local file
 */
struct PushOutcome {
  upload::CompletedUpload completed;
  bool resumed = false;            // picked up an existing session
  bool already_completed = false;  // another session finished the key first
  uint64_t chunks_sent = 0;
  uint64_t chunks_skipped = 0;     // already stored before this push
  int retries = 0;
};

/**
 * Resumable upload of a local file through the coordinator.
 *
 * Mirrors the browser client: signature from name, size and mtime, then
 * init, then chunks after the stored ones, then complete. A chunk that fails
 * with a retryable error is resent after a backoff delay.
 */
class FileUploader {
public:
  using ProgressCallback = std::function<void(uint64_t chunks_done, uint64_t total_chunks)>;
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  FileUploader(
    upload::UploadCoordinator& coordinator, const upload::RetryConfig& retry = {},
    Sleeper sleeper = nullptr
  );

  void setProgressCallback(ProgressCallback callback) {
    progress_cb_ = std::move(callback);
  }

  upload::Result<PushOutcome> push(const std::string& path);

private:
  upload::Result<std::string> sendChunk(
    const upload::InitResult& session, int part_number, const std::vector<uint8_t>& bytes,
    int& retries
  );

  upload::UploadCoordinator& coordinator_;
  upload::RetryHandler retry_;
  Sleeper sleeper_;
  ProgressCallback progress_cb_;
};

}  // namespace cli
}  // namespace folio

#endif  // FOLIO_FILE_UPLOADER_HPP
