// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_handler.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <set>

namespace folio {
namespace upload {

namespace {

const std::set<std::string>& throttledCodes() {
  static const std::set<std::string> codes = {
    "SlowDown",
    "Throttling",
    "ThrottlingException",
    "RequestLimitExceeded",
    "TooManyRequests",
  };
  return codes;
}

const std::set<std::string>& transientCodes() {
  static const std::set<std::string> codes = {
    // S3
    "RequestTimeout",
    "ServiceUnavailable",
    "InternalError",
    "RequestTimeTooSkewed",
    "OperationAborted",
    // Transport
    "ConnectionReset",
    "ConnectionTimeout",
    "ConnectionRefused",
    "NetworkingError",
    "UnknownEndpoint",
    // MinIO
    "XMinioServerNotInitialized",
    "XAmzContentSHA256Mismatch",
  };
  return codes;
}

// "HTTP503" -> 503, anything else -> 0
int syntheticHttpStatus(const std::string& code) {
  static const std::string kPrefix = "HTTP";
  if (code.size() != kPrefix.size() + 3 || code.compare(0, kPrefix.size(), kPrefix) != 0) {
    return 0;
  }
  int status = 0;
  for (size_t i = kPrefix.size(); i < code.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(code[i]))) {
      return 0;
    }
    status = status * 10 + (code[i] - '0');
  }
  return status;
}

}  // namespace

const char* retryClassName(RetryClass retry_class) {
  switch (retry_class) {
    case RetryClass::Permanent:
      return "Permanent";
    case RetryClass::Transient:
      return "Transient";
    case RetryClass::Throttled:
      return "Throttled";
  }
  return "Unknown";
}

std::chrono::milliseconds RetryHandler::getDelay(int retry_count) const {
  double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                    std::pow(config_.exponential_base, static_cast<double>(retry_count));
  delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

  if (config_.jitter) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<> dist(1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor);
    delay_ms *= dist(rng_);
  }

  delay_ms = std::max(delay_ms, 1.0);
  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

std::chrono::milliseconds RetryHandler::getDelay(const UploadError& error, int retry_count) const {
  if (classify(error) == RetryClass::Throttled) {
    return getDelay(retry_count + 1);
  }
  return getDelay(retry_count);
}

RetryClass RetryHandler::classify(const std::string& backend_code) {
  if (throttledCodes().count(backend_code) > 0) {
    return RetryClass::Throttled;
  }
  if (transientCodes().count(backend_code) > 0) {
    return RetryClass::Transient;
  }

  int status = syntheticHttpStatus(backend_code);
  if (status == 429) {
    return RetryClass::Throttled;
  }
  if (status >= 500 && status <= 599) {
    return RetryClass::Transient;
  }
  return RetryClass::Permanent;
}

RetryClass RetryHandler::classify(const UploadError& error) {
  switch (error.code) {
    case ErrorCode::KeyTooLong:
    case ErrorCode::MalformedKey:
    case ErrorCode::SessionNotFound:
    case ErrorCode::ExpiredSession:
    case ErrorCode::CapacityExceeded:
    case ErrorCode::AlreadyCompleted:
    case ErrorCode::InvalidArgument:
      return RetryClass::Permanent;
    case ErrorCode::PartUploadFailed:
    case ErrorCode::CompletionFailed:
    case ErrorCode::AbortFailed:
    case ErrorCode::BackendError:
      break;
  }

  RetryClass by_code = classify(error.backend_code);
  if (by_code != RetryClass::Permanent) {
    return by_code;
  }
  // The store may know better, e.g. the SDK flagged a transport fault
  return error.retryable ? RetryClass::Transient : RetryClass::Permanent;
}

}  // namespace upload
}  // namespace folio
