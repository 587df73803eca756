// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "expiry_reaper.hpp"

#include <utility>

#include "object_key.hpp"

#define FOLIO_LOG_COMPONENT "expiry_reaper"
#include <folio_log_macros.hpp>

namespace folio {
namespace upload {

using ::folio::logging::kv;

ExpiryReaper::ExpiryReaper(IObjectStore& store, const ReaperConfig& config, WallClock clock)
    : store_(store)
    , config_(config)
    , clock_(std::move(clock)) {}

ExpiryReaper::~ExpiryReaper() {
  stop();
}

Result<size_t> ExpiryReaper::sweep(std::chrono::hours max_age) {
  if (max_age.count() <= 0) {
    return Result<size_t>::Failure(ErrorCode::InvalidArgument, "max_age must be positive");
  }

  // Ages reaching back past the epoch would overflow the cutoff; nothing is that old
  const auto now = clock_();
  if (max_age >= std::chrono::duration_cast<std::chrono::hours>(now.time_since_epoch())) {
    FOLIO_LOG_DEBUG(
      "Max age predates the epoch, nothing to sweep" << kv("max_age_h", max_age.count())
    );
    return Result<size_t>::Success(0);
  }
  const auto cutoff = now - max_age;

  auto listing = listAllUploads(store_, kUploadsPrefix);
  if (!listing.success) {
    FOLIO_LOG_ERROR("Sweep could not list uploads" << kv("error", listing.error_message));
    return Result<size_t>::Failure(
      ErrorCode::BackendError, "List uploads failed: " + listing.error_message,
      listing.error_code, listing.is_retryable
    );
  }

  size_t aborted = 0;
  for (const auto& upload : listing.uploads) {
    if (!decodeKey(upload.key)) {
      continue;
    }
    if (!(upload.initiated < cutoff)) {
      continue;
    }

    auto result = store_.abortMultipartUpload(upload.key, upload.upload_id);
    if (!result.success) {
      FOLIO_LOG_WARN(
        "Failed to abort expired upload" << kv("upload_id", upload.upload_id)
                                         << kv("code", result.error_code)
                                         << kv("error", result.error_message)
      );
      continue;
    }
    FOLIO_LOG_DEBUG("Aborted expired upload" << kv("upload_id", upload.upload_id));
    ++aborted;
  }

  if (aborted > 0) {
    FOLIO_LOG_INFO(
      "Cleaned up expired uploads" << kv("count", aborted) << kv("max_age_h", max_age.count())
    );
  }
  return Result<size_t>::Success(aborted);
}

void ExpiryReaper::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_.load()) {
    return;
  }
  stop_requested_ = false;
  running_.store(true);
  thread_ = std::thread(&ExpiryReaper::run, this);

  FOLIO_LOG_INFO(
    "Reaper started" << kv("max_age_h", config_.max_age.count())
                     << kv("interval_ms", config_.interval.count())
  );
}

void ExpiryReaper::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load()) {
      return;
    }
    stop_requested_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
  running_.store(false);
  FOLIO_LOG_INFO("Reaper stopped" << kv("sweeps", sweep_count_.load()));
}

void ExpiryReaper::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    lock.unlock();
    auto result = sweep(config_.max_age);
    if (result) {
      total_aborted_ += result.value();
    } else {
      FOLIO_LOG_WARN("Sweep failed, retrying next interval" << kv("error", result.error().describe()));
    }
    ++sweep_count_;
    lock.lock();

    cv_.wait_for(lock, config_.interval, [this] {
      return stop_requested_;
    });
  }
}

}  // namespace upload
}  // namespace folio
