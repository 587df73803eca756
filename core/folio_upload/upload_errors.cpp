// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_errors.hpp"

namespace folio {
namespace upload {

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::KeyTooLong:
      return "KeyTooLong";
    case ErrorCode::MalformedKey:
      return "MalformedKey";
    case ErrorCode::SessionNotFound:
      return "SessionNotFound";
    case ErrorCode::ExpiredSession:
      return "ExpiredSession";
    case ErrorCode::CapacityExceeded:
      return "CapacityExceeded";
    case ErrorCode::PartUploadFailed:
      return "PartUploadFailed";
    case ErrorCode::CompletionFailed:
      return "CompletionFailed";
    case ErrorCode::AbortFailed:
      return "AbortFailed";
    case ErrorCode::AlreadyCompleted:
      return "AlreadyCompleted";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::BackendError:
      return "BackendError";
  }
  return "Unknown";
}

std::string UploadError::describe() const {
  std::string text = std::string(errorCodeName(code)) + ": " + message;
  if (!backend_code.empty()) {
    text += " (backend: " + backend_code + ")";
  }
  return text;
}

}  // namespace upload
}  // namespace folio
