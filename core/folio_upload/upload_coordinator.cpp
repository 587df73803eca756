// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_coordinator.hpp"

#include <algorithm>

#include "object_key.hpp"
#include "retry_handler.hpp"

#define FOLIO_LOG_COMPONENT "upload_coordinator"
#include <folio_log_macros.hpp>

namespace folio {
namespace upload {

using ::folio::logging::kv;

namespace {

// Upper bound the S3 presigner accepts (7 days)
constexpr std::chrono::seconds kMaxUrlTtl{7 * 24 * 3600};

bool isTransient(const StoreResult& result) {
  return result.is_retryable || RetryHandler::isRetryableError(result.error_code);
}

template<typename T>
Result<T> backendFailure(ErrorCode code, const std::string& context, const StoreResult& result) {
  return Result<T>::Failure(
    code, context + ": " + result.error_message, result.error_code, isTransient(result)
  );
}

// Session choice on resume: exact key match first, then most recently initiated
const MultipartUploadInfo* pickSession(
  const std::vector<MultipartUploadInfo>& uploads, const std::string& key
) {
  const MultipartUploadInfo* chosen = nullptr;
  for (const auto& upload : uploads) {
    if (!chosen) {
      chosen = &upload;
      continue;
    }
    bool exact = upload.key == key;
    bool chosen_exact = chosen->key == key;
    if (exact != chosen_exact) {
      if (exact) {
        chosen = &upload;
      }
      continue;
    }
    if (upload.initiated > chosen->initiated) {
      chosen = &upload;
    }
  }
  return chosen;
}

}  // namespace

UploadCoordinator::UploadCoordinator(IObjectStore& store, uint64_t default_chunk_size)
    : store_(store)
    , default_chunk_size_(std::clamp(default_chunk_size, kMinPartSize, kMaxPartSize)) {
  if (default_chunk_size_ != default_chunk_size) {
    FOLIO_LOG_WARN(
      "Chunk size out of range, clamped" << kv("requested", default_chunk_size)
                                         << kv("used", default_chunk_size_)
    );
  }
}

Result<InitResult> UploadCoordinator::initOrResume(
  const std::string& signature, const std::string& file_name, uint64_t file_size
) {
  auto key_result = encodeKey(signature, file_name);
  if (!key_result) {
    return Result<InitResult>::Failure(key_result.error());
  }
  const std::string& key = key_result.value();

  if (file_size == 0) {
    return Result<InitResult>::Failure(ErrorCode::InvalidArgument, "File is empty");
  }
  if (file_size > kMaxObjectSize) {
    return Result<InitResult>::Failure(
      ErrorCode::CapacityExceeded,
      "File size " + std::to_string(file_size) + " exceeds the 5 TiB object limit"
    );
  }
  uint64_t default_total = chunkCount(file_size, default_chunk_size_);
  if (default_total > static_cast<uint64_t>(kMaxPartCount)) {
    return Result<InitResult>::Failure(
      ErrorCode::CapacityExceeded,
      "File needs " + std::to_string(default_total) + " chunks of " +
        std::to_string(default_chunk_size_) + " bytes, limit is " + std::to_string(kMaxPartCount)
    );
  }

  auto listing = listAllUploads(store_, signaturePrefix(signature));
  if (!listing.success) {
    FOLIO_LOG_ERROR(
      "Failed to list sessions" << kv("signature", signature)
                                << kv("error", listing.error_message)
    );
    return backendFailure<InitResult>(ErrorCode::BackendError, "List uploads failed", listing);
  }

  if (const MultipartUploadInfo* session = pickSession(listing.uploads, key)) {
    auto parts = listAllParts(store_, session->key, session->upload_id);
    if (parts.success) {
      uint64_t chunk_size = default_chunk_size_;
      auto lowest = std::min_element(
        parts.parts.begin(),
        parts.parts.end(),
        [](const PartInfo& a, const PartInfo& b) {
          return a.part_number < b.part_number;
        }
      );
      if (lowest != parts.parts.end() && lowest->size > 0) {
        chunk_size = lowest->size;
      }

      uint64_t total = chunkCount(file_size, chunk_size);
      if (total > static_cast<uint64_t>(kMaxPartCount)) {
        return Result<InitResult>::Failure(
          ErrorCode::CapacityExceeded,
          "Session chunk size " + std::to_string(chunk_size) + " needs " + std::to_string(total) +
            " chunks, limit is " + std::to_string(kMaxPartCount)
        );
      }

      InitResult result;
      result.upload_id = session->upload_id;
      result.key = session->key;
      result.chunk_size = chunk_size;
      result.total_chunks = total;
      result.completed_chunks = parts.parts.size();
      result.is_resume = true;

      FOLIO_LOG_INFO(
        "Resuming upload" << kv("upload_id", result.upload_id) << kv("key", result.key)
                          << kv("completed", result.completed_chunks)
                          << kv("total", result.total_chunks)
      );
      return Result<InitResult>::Success(result);
    }

    if (parts.error_code != kNoSuchUpload) {
      return backendFailure<InitResult>(ErrorCode::BackendError, "List parts failed", parts);
    }
    // Completed, aborted or reaped between the two listings
    FOLIO_LOG_WARN(
      "Session vanished during resume, starting a new one"
      << kv("upload_id", session->upload_id) << kv("key", session->key)
    );
  }

  return createSession(key, file_size, default_total);
}

Result<InitResult> UploadCoordinator::createSession(
  const std::string& key, uint64_t file_size, uint64_t total_chunks
) {
  auto created = store_.createMultipartUpload(key);
  if (!created.success) {
    FOLIO_LOG_ERROR(
      "Failed to create session" << kv("key", key) << kv("error", created.error_message)
    );
    return backendFailure<InitResult>(
      ErrorCode::BackendError, "Create multipart upload failed", created
    );
  }

  InitResult result;
  result.upload_id = created.upload_id;
  result.key = key;
  result.chunk_size = default_chunk_size_;
  result.total_chunks = total_chunks;
  result.completed_chunks = 0;
  result.is_resume = false;

  FOLIO_LOG_INFO(
    "Started upload" << kv("upload_id", result.upload_id) << kv("key", key)
                     << kv("size", file_size) << kv("chunks", total_chunks)
  );
  return Result<InitResult>::Success(result);
}

Result<std::string> UploadCoordinator::uploadPart(
  const std::string& upload_id, const std::string& key, int part_number,
  const std::vector<uint8_t>& bytes
) {
  if (upload_id.empty() || key.empty()) {
    return Result<std::string>::Failure(ErrorCode::InvalidArgument, "upload_id and key are required");
  }
  if (part_number < 1 || part_number > kMaxPartCount) {
    return Result<std::string>::Failure(
      ErrorCode::InvalidArgument,
      "Part number " + std::to_string(part_number) + " outside 1.." + std::to_string(kMaxPartCount)
    );
  }
  if (bytes.size() > kMaxPartSize) {
    return Result<std::string>::Failure(
      ErrorCode::CapacityExceeded,
      "Chunk of " + std::to_string(bytes.size()) + " bytes exceeds the 5 GiB part limit"
    );
  }

  auto result = store_.uploadPart(key, upload_id, part_number, bytes);
  if (!result.success) {
    if (result.error_code == kNoSuchUpload) {
      FOLIO_LOG_WARN("Part rejected, session gone" << kv("upload_id", upload_id) << kv("key", key));
      return backendFailure<std::string>(ErrorCode::ExpiredSession, "Session no longer exists", result);
    }
    FOLIO_LOG_WARN(
      "Part upload failed" << kv("upload_id", upload_id) << kv("part", part_number)
                           << kv("code", result.error_code) << kv("error", result.error_message)
    );
    return backendFailure<std::string>(
      ErrorCode::PartUploadFailed, "Part " + std::to_string(part_number) + " failed", result
    );
  }

  FOLIO_LOG_DEBUG(
    "Part stored" << kv("upload_id", upload_id) << kv("part", part_number)
                  << kv("bytes", bytes.size())
  );
  return Result<std::string>::Success(result.etag);
}

Result<CompletedUpload> UploadCoordinator::complete(
  const std::string& upload_id, const std::string& key
) {
  auto decoded = decodeKey(key);
  if (!decoded) {
    return Result<CompletedUpload>::Failure(decoded.error());
  }
  if (upload_id.empty()) {
    return Result<CompletedUpload>::Failure(ErrorCode::InvalidArgument, "upload_id is required");
  }
  FOLIO_LOG_SCOPED_CONTEXT(upload_id, decoded.value().signature);

  // The prefix listing may also return keys that extend this one
  auto listing = listAllUploads(store_, key);
  if (!listing.success) {
    return backendFailure<CompletedUpload>(
      ErrorCode::CompletionFailed, "List uploads failed", listing
    );
  }
  auto session = std::find_if(
    listing.uploads.begin(),
    listing.uploads.end(),
    [&](const MultipartUploadInfo& upload) {
      return upload.key == key && upload.upload_id == upload_id;
    }
  );
  if (session == listing.uploads.end()) {
    return resolveMissingSession(upload_id, key);
  }

  // An object written after this session began means a concurrent session
  // for the same file won the race
  auto head = store_.headObject(key);
  if (!head.success) {
    return backendFailure<CompletedUpload>(ErrorCode::CompletionFailed, "Head object failed", head);
  }
  if (head.found && head.last_modified >= session->initiated) {
    FOLIO_LOG_WARN("Key already completed by another session, discarding this one" << kv("key", key));
    auto aborted = store_.abortMultipartUpload(key, upload_id);
    if (!aborted.success) {
      FOLIO_LOG_WARN(
        "Failed to abort superseded session" << kv("code", aborted.error_code)
                                             << kv("error", aborted.error_message)
      );
    }
    return Result<CompletedUpload>::Failure(
      ErrorCode::AlreadyCompleted, "Object " + key + " was completed by another session"
    );
  }

  auto parts = listAllParts(store_, key, upload_id);
  if (!parts.success) {
    if (parts.error_code == kNoSuchUpload) {
      return resolveMissingSession(upload_id, key);
    }
    return backendFailure<CompletedUpload>(ErrorCode::CompletionFailed, "List parts failed", parts);
  }

  std::sort(parts.parts.begin(), parts.parts.end(), [](const PartInfo& a, const PartInfo& b) {
    return a.part_number < b.part_number;
  });
  if (parts.parts.empty()) {
    return Result<CompletedUpload>::Failure(ErrorCode::CompletionFailed, "No parts uploaded");
  }

  std::vector<CompletedPart> manifest;
  manifest.reserve(parts.parts.size());
  for (size_t i = 0; i < parts.parts.size(); ++i) {
    int expected = static_cast<int>(i) + 1;
    if (parts.parts[i].part_number != expected) {
      FOLIO_LOG_WARN(
        "Cannot complete, parts not contiguous" << kv("expected", expected)
                                                << kv("found", parts.parts[i].part_number)
      );
      return Result<CompletedUpload>::Failure(
        ErrorCode::CompletionFailed, "Part " + std::to_string(expected) + " is missing"
      );
    }
    manifest.push_back(CompletedPart{parts.parts[i].part_number, parts.parts[i].etag});
  }

  auto result = store_.completeMultipartUpload(key, upload_id, manifest);
  if (!result.success) {
    if (result.error_code == kNoSuchUpload) {
      return resolveMissingSession(upload_id, key);
    }
    FOLIO_LOG_ERROR(
      "Completion rejected" << kv("code", result.error_code) << kv("error", result.error_message)
    );
    return backendFailure<CompletedUpload>(
      ErrorCode::CompletionFailed, "Complete multipart upload failed", result
    );
  }

  CompletedUpload completed;
  completed.key = result.key.empty() ? key : result.key;
  completed.signature = decoded.value().signature;
  completed.file_name = decoded.value().file_name;
  completed.location = result.location;
  completed.etag = result.etag;

  FOLIO_LOG_INFO(
    "Upload completed" << kv("key", completed.key) << kv("parts", manifest.size())
                       << kv("file", completed.file_name)
  );
  return Result<CompletedUpload>::Success(completed);
}

Result<CompletedUpload> UploadCoordinator::resolveMissingSession(
  const std::string& upload_id, const std::string& key, ErrorCode head_failure
) {
  auto head = store_.headObject(key);
  if (!head.success) {
    return backendFailure<CompletedUpload>(head_failure, "Head object failed", head);
  }
  if (head.found) {
    FOLIO_LOG_INFO("Session already finished" << kv("upload_id", upload_id) << kv("key", key));
    return Result<CompletedUpload>::Failure(
      ErrorCode::AlreadyCompleted, "Object " + key + " already completed", kNoSuchUpload
    );
  }
  FOLIO_LOG_WARN("Session expired" << kv("upload_id", upload_id) << kv("key", key));
  return Result<CompletedUpload>::Failure(
    ErrorCode::ExpiredSession, "Upload " + upload_id + " no longer exists", kNoSuchUpload
  );
}

Result<void> UploadCoordinator::abort(const std::string& upload_id, const std::string& key) {
  if (upload_id.empty() || key.empty()) {
    return Result<void>::Failure(ErrorCode::InvalidArgument, "upload_id and key are required");
  }

  auto result = store_.abortMultipartUpload(key, upload_id);
  if (!result.success) {
    FOLIO_LOG_WARN(
      "Abort failed" << kv("upload_id", upload_id) << kv("code", result.error_code)
                     << kv("error", result.error_message)
    );
    return Result<void>::Failure(
      ErrorCode::AbortFailed, "Abort failed: " + result.error_message, result.error_code,
      isTransient(result)
    );
  }

  FOLIO_LOG_INFO("Aborted upload" << kv("upload_id", upload_id) << kv("key", key));
  return Result<void>::Success();
}

PendingUploadSummary UploadCoordinator::summarize(
  const MultipartUploadInfo& upload, const std::vector<PartInfo>& parts
) {
  PendingUploadSummary summary;
  summary.upload_id = upload.upload_id;
  summary.key = upload.key;
  summary.created_at = upload.initiated;

  auto decoded = decodeKey(upload.key);
  if (decoded) {
    summary.signature = decoded.value().signature;
    summary.file_name = decoded.value().file_name;
  }

  summary.completed_chunks = parts.size();
  for (const auto& part : parts) {
    summary.bytes_uploaded += part.size;
  }
  return summary;
}

Result<std::vector<PendingUploadSummary>> UploadCoordinator::listPending() {
  auto listing = listAllUploads(store_, kUploadsPrefix);
  if (!listing.success) {
    return backendFailure<std::vector<PendingUploadSummary>>(
      ErrorCode::BackendError, "List uploads failed", listing
    );
  }

  std::vector<PendingUploadSummary> pending;
  for (const auto& upload : listing.uploads) {
    if (!decodeKey(upload.key)) {
      FOLIO_LOG_DEBUG("Skipping foreign key" << kv("key", upload.key));
      continue;
    }
    auto parts = listAllParts(store_, upload.key, upload.upload_id);
    if (!parts.success) {
      FOLIO_LOG_WARN(
        "Failed to get parts, reporting no progress" << kv("upload_id", upload.upload_id)
                                                     << kv("error", parts.error_message)
      );
      parts.parts.clear();
    }
    pending.push_back(summarize(upload, parts.parts));
  }

  std::stable_sort(
    pending.begin(),
    pending.end(),
    [](const PendingUploadSummary& a, const PendingUploadSummary& b) {
      return a.created_at > b.created_at;
    }
  );
  return Result<std::vector<PendingUploadSummary>>::Success(std::move(pending));
}

Result<PendingUploadSummary> UploadCoordinator::status(const std::string& upload_id) {
  if (upload_id.empty()) {
    return Result<PendingUploadSummary>::Failure(ErrorCode::InvalidArgument, "upload_id is required");
  }

  auto listing = listAllUploads(store_, kUploadsPrefix);
  if (!listing.success) {
    return backendFailure<PendingUploadSummary>(
      ErrorCode::BackendError, "List uploads failed", listing
    );
  }

  for (const auto& upload : listing.uploads) {
    if (upload.upload_id != upload_id) {
      continue;
    }
    auto decoded = decodeKey(upload.key);
    if (!decoded) {
      return Result<PendingUploadSummary>::Failure(decoded.error());
    }

    auto parts = listAllParts(store_, upload.key, upload.upload_id);
    if (!parts.success) {
      // Completed or aborted between the listing and this call
      if (parts.error_code == kNoSuchUpload) {
        return Result<PendingUploadSummary>::Failure(
          resolveMissingSession(upload_id, upload.key, ErrorCode::BackendError).error()
        );
      }
      return backendFailure<PendingUploadSummary>(
        ErrorCode::BackendError, "List parts failed", parts
      );
    }
    return Result<PendingUploadSummary>::Success(summarize(upload, parts.parts));
  }

  return Result<PendingUploadSummary>::Failure(
    ErrorCode::SessionNotFound, "No open upload with id " + upload_id
  );
}

Result<std::string> UploadCoordinator::downloadUrl(const std::string& key, std::chrono::seconds ttl) {
  auto decoded = decodeKey(key);
  if (!decoded) {
    return Result<std::string>::Failure(decoded.error());
  }
  if (ttl.count() <= 0 || ttl > kMaxUrlTtl) {
    return Result<std::string>::Failure(
      ErrorCode::InvalidArgument, "URL lifetime must be between 1s and 7 days"
    );
  }

  auto result = store_.presignGetObject(key, ttl);
  if (!result.success) {
    return backendFailure<std::string>(ErrorCode::BackendError, "Presign failed", result);
  }
  return Result<std::string>::Success(result.url);
}

}  // namespace upload
}  // namespace folio
