// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_RETRY_HANDLER_HPP
#define FOLIO_RETRY_HANDLER_HPP

#include <chrono>
#include <mutex>
#include <ostream>
#include <random>
#include <string>

#include "upload_errors.hpp"

namespace folio {
namespace upload {

/**
 * Backoff settings for chunk and completion retries on the client side
 */
struct RetryConfig {
  int max_retries = 5;                           // attempts after the first failure
  std::chrono::milliseconds initial_delay{500};  // delay before the first retry
  std::chrono::milliseconds max_delay{30000};    // cap before jitter
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.5;  // delay scaled by a factor in [1-f, 1+f]
};

/**
 * How a failed upload call should be treated by the caller
 */
enum class RetryClass {
  Permanent,  // retrying cannot help: bad input, or the session is gone or finished
  Transient,  // network or server fault, retry with normal backoff
  Throttled,  // backend asked us to slow down, retry one backoff step later
};

const char* retryClassName(RetryClass retry_class);

inline std::ostream& operator<<(std::ostream& os, RetryClass retry_class) {
  return os << retryClassName(retry_class);
}

/**
 * Retry policy for UploadCoordinator results.
 *
 * The coordinator never retries. It reports an UploadError carrying the
 * backend's code and retryable flag, and FileUploader asks this class
 * whether and when to send the chunk again.
 *
 * Classification looks at the folio ErrorCode first. Codes describing the
 * request or the session's lifecycle (InvalidArgument, MalformedKey,
 * ExpiredSession, AlreadyCompleted and the like) are permanent no matter
 * what the backend said, since a new init is needed. Backend failures are
 * then judged by their S3 code, falling back to the retryable flag the
 * store set.
 *
 * getDelay() may be called from several threads.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config)
      , rng_(std::random_device{}()) {}

  /**
   * initial_delay * base^retry_count, capped at max_delay, then jittered.
   * Never less than 1ms.
   *
   * @param retry_count Retries already made (0 before the first retry)
   */
  std::chrono::milliseconds getDelay(int retry_count) const;

  /**
   * Delay before retrying after `error`. Throttled errors wait as if one
   * more retry had already been made.
   */
  std::chrono::milliseconds getDelay(const UploadError& error, int retry_count) const;

  bool shouldRetry(int retry_count) const {
    return retry_count < config_.max_retries;
  }

  /**
   * True while attempts remain and the error is not permanent
   */
  bool shouldRetry(const UploadError& error, int retry_count) const {
    return classify(error) != RetryClass::Permanent && shouldRetry(retry_count);
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  const RetryConfig& config() const {
    return config_;
  }

  /**
   * Classify an S3, MinIO or transport error code. Codes the S3 adapter
   * synthesizes from bare HTTP statuses ("HTTP503") are judged by status:
   * 5xx is transient, 429 is throttled.
   */
  static RetryClass classify(const std::string& backend_code);

  static RetryClass classify(const UploadError& error);

  /**
   * True for transient and throttled backend codes. NoSuchUpload is
   * permanent: the session was completed, aborted or expired.
   */
  static bool isRetryableError(const std::string& backend_code) {
    return classify(backend_code) != RetryClass::Permanent;
  }

private:
  RetryConfig config_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_RETRY_HANDLER_HPP
