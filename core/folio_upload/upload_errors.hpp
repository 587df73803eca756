// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_UPLOAD_ERRORS_HPP
#define FOLIO_UPLOAD_ERRORS_HPP

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace folio {
namespace upload {

/**
 * Failure classes reported by coordinator operations
 */
enum class ErrorCode {
  KeyTooLong,
  MalformedKey,
  SessionNotFound,
  ExpiredSession,
  CapacityExceeded,
  PartUploadFailed,
  CompletionFailed,
  AbortFailed,
  AlreadyCompleted,  // another session finished this key first
  InvalidArgument,
  BackendError,
};

const char* errorCodeName(ErrorCode code);

inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
  return os << errorCodeName(code);
}

/**
 * Error carried by a failed Result
 */
struct UploadError {
  ErrorCode code;
  std::string message;
  std::string backend_code;  // backend error code, e.g. "NoSuchUpload"
  bool retryable = false;    // true if repeating the same call may succeed

  /**
   * "Code: message (backend: X)" for logs and CLI output
   */
  std::string describe() const;
};

/**
 * Value-or-error return type of coordinator operations.
 *
 * Construct through Success()/Failure(). value() on a failed result throws
 * std::logic_error; check ok() first.
 */
template<typename T>
class Result {
public:
  static Result Success(T value) {
    Result result;
    result.value_ = std::move(value);
    return result;
  }

  static Result Failure(UploadError error) {
    Result result;
    result.error_ = std::move(error);
    return result;
  }

  static Result Failure(
    ErrorCode code, const std::string& message, const std::string& backend_code = "",
    bool retryable = false
  ) {
    return Failure(UploadError{code, message, backend_code, retryable});
  }

  bool ok() const {
    return value_.has_value();
  }

  explicit operator bool() const {
    return ok();
  }

  const T& value() const {
    if (!value_) {
      throw std::logic_error("Result holds an error: " + error_->describe());
    }
    return *value_;
  }

  T& value() {
    if (!value_) {
      throw std::logic_error("Result holds an error: " + error_->describe());
    }
    return *value_;
  }

  const UploadError& error() const {
    if (!error_) {
      throw std::logic_error("Result holds a value, not an error");
    }
    return *error_;
  }

private:
  Result() = default;

  std::optional<T> value_;
  std::optional<UploadError> error_;
};

/**
 * Result of operations that produce no value
 */
template<>
class Result<void> {
public:
  static Result Success() {
    return Result();
  }

  static Result Failure(UploadError error) {
    Result result;
    result.error_ = std::move(error);
    return result;
  }

  static Result Failure(
    ErrorCode code, const std::string& message, const std::string& backend_code = "",
    bool retryable = false
  ) {
    return Failure(UploadError{code, message, backend_code, retryable});
  }

  bool ok() const {
    return !error_.has_value();
  }

  explicit operator bool() const {
    return ok();
  }

  const UploadError& error() const {
    if (!error_) {
      throw std::logic_error("Result holds no error");
    }
    return *error_;
  }

private:
  Result() = default;

  std::optional<UploadError> error_;
};

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_UPLOAD_ERRORS_HPP
