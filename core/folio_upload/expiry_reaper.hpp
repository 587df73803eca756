// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_EXPIRY_REAPER_HPP
#define FOLIO_EXPIRY_REAPER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "object_store.hpp"
#include "upload_errors.hpp"
#include "upload_limits.hpp"

namespace folio {
namespace upload {

struct ReaperConfig {
  std::chrono::hours max_age = kDefaultMaxSessionAge;
  std::chrono::milliseconds interval = kDefaultSweepInterval;
};

/**
 * Aborts multipart sessions abandoned for longer than a maximum age.
 *
 * sweep() can be called directly; start() runs it on a dedicated thread,
 * once immediately and then every interval, until stop().
 */
class ExpiryReaper {
public:
  ExpiryReaper(
    IObjectStore& store, const ReaperConfig& config = {},
    WallClock clock = std::chrono::system_clock::now
  );
  ~ExpiryReaper();

  // Non-copyable, non-movable
  ExpiryReaper(const ExpiryReaper&) = delete;
  ExpiryReaper& operator=(const ExpiryReaper&) = delete;
  ExpiryReaper(ExpiryReaper&&) = delete;
  ExpiryReaper& operator=(ExpiryReaper&&) = delete;

  /**
   * Abort every session under uploads/ initiated strictly before now - max_age.
   *
   * Keys that do not decode are left alone. A failed abort is logged and
   * skipped; it does not count.
   *
   * @return Number of sessions aborted, or BackendError if listing fails
   */
  Result<size_t> sweep(std::chrono::hours max_age);

  Result<size_t> sweep() {
    return sweep(config_.max_age);
  }

  /**
   * Start the background sweep thread. No-op if already running.
   */
  void start();

  /**
   * Wake and join the sweep thread. No-op if not running.
   */
  void stop();

  bool isRunning() const {
    return running_.load();
  }

  /**
   * Completed background sweeps since start()
   */
  size_t sweepCount() const {
    return sweep_count_.load();
  }

  /**
   * Sessions aborted by background sweeps since start()
   */
  size_t totalAborted() const {
    return total_aborted_.load();
  }

private:
  void run();

  IObjectStore& store_;
  ReaperConfig config_;
  WallClock clock_;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::atomic<bool> running_{false};
  std::atomic<size_t> sweep_count_{0};
  std::atomic<size_t> total_aborted_{0};
};

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_EXPIRY_REAPER_HPP
