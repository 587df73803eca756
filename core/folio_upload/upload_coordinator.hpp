// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_UPLOAD_COORDINATOR_HPP
#define FOLIO_UPLOAD_COORDINATOR_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "object_store.hpp"
#include "upload_errors.hpp"
#include "upload_limits.hpp"

namespace folio {
namespace upload {

/**
 * Session view returned by initOrResume
 */
struct InitResult {
  std::string upload_id;
  std::string key;
  uint64_t chunk_size = 0;
  uint64_t total_chunks = 0;
  uint64_t completed_chunks = 0;  // parts already stored at the backend
  bool is_resume = false;         // true if an existing session was picked up
};

/**
 * Progress of an in-progress session, derived from backend listings only
 */
struct PendingUploadSummary {
  std::string upload_id;
  std::string key;
  std::string signature;
  std::string file_name;
  uint64_t completed_chunks = 0;
  uint64_t bytes_uploaded = 0;
  std::chrono::system_clock::time_point created_at;
};

/**
 * A finished object, handed off to cataloging
 */
struct CompletedUpload {
  std::string key;
  std::string signature;
  std::string file_name;
  std::string location;
  std::string etag;
};

/**
 * Multipart session orchestration over an object store.
 *
 * Holds no session state: every answer is recomputed from the backend's
 * multipart listings, so any instance (or a fresh process after a restart)
 * sees the same sessions. Safe to call from several threads at once.
 *
 * Session lifecycle at the backend:
 *   NonExistent -> Open -> Completed | Aborted | Expired
 * Only Open sessions accept parts.
 */
class UploadCoordinator {
public:
  explicit UploadCoordinator(IObjectStore& store, uint64_t default_chunk_size = kDefaultChunkSize);

  // Non-copyable
  UploadCoordinator(const UploadCoordinator&) = delete;
  UploadCoordinator& operator=(const UploadCoordinator&) = delete;

  /**
   * Resume the session of a file or start a new one.
   *
   * An existing session under the file's signature is preferred when its
   * key matches exactly, then by most recent initiation. Its chunk size is
   * the size of its lowest-numbered part; total_chunks always comes from
   * file_size as given now.
   *
   * @return MalformedKey, KeyTooLong, InvalidArgument (empty file),
   *         CapacityExceeded (too large for the part-count ceiling) or
   *         BackendError
   */
  Result<InitResult> initOrResume(
    const std::string& signature, const std::string& file_name, uint64_t file_size
  );

  /**
   * Store one chunk. Parts may arrive in any order; repeating a part number
   * replaces the earlier bytes. Never retried here.
   *
   * @return ETag of the stored part, or InvalidArgument, CapacityExceeded,
   *         ExpiredSession (session gone) or PartUploadFailed
   */
  Result<std::string> uploadPart(
    const std::string& upload_id, const std::string& key, int part_number,
    const std::vector<uint8_t>& bytes
  );

  /**
   * Assemble the stored parts into the final object.
   *
   * Parts must be exactly 1..N. On CompletionFailed the session stays open
   * and can be completed after the missing parts are uploaded.
   *
   * @return AlreadyCompleted if another session finished this key first,
   *         ExpiredSession if the session is gone and no object exists
   */
  Result<CompletedUpload> complete(const std::string& upload_id, const std::string& key);

  Result<void> abort(const std::string& upload_id, const std::string& key);

  /**
   * Every open session under uploads/, newest first. Sessions whose parts
   * cannot be listed are reported with zero progress.
   */
  Result<std::vector<PendingUploadSummary>> listPending();

  /**
   * @return SessionNotFound if no open session has this id. A session that
   *         vanishes before its parts are listed resolves like completion:
   *         AlreadyCompleted if the object exists, ExpiredSession if not.
   */
  Result<PendingUploadSummary> status(const std::string& upload_id);

  /**
   * Presigned GET URL for a completed object
   */
  Result<std::string> downloadUrl(
    const std::string& key, std::chrono::seconds ttl = kDefaultUrlTtl
  );

  uint64_t defaultChunkSize() const {
    return default_chunk_size_;
  }

private:
  Result<InitResult> createSession(
    const std::string& key, uint64_t file_size, uint64_t total_chunks
  );

  // AlreadyCompleted if the object exists, ExpiredSession otherwise
  Result<CompletedUpload> resolveMissingSession(
    const std::string& upload_id,
    const std::string& key,
    ErrorCode head_failure = ErrorCode::CompletionFailed
  );

  PendingUploadSummary summarize(
    const MultipartUploadInfo& upload, const std::vector<PartInfo>& parts
  );

  IObjectStore& store_;
  uint64_t default_chunk_size_;
};

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_UPLOAD_COORDINATOR_HPP
