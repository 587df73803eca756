// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_OBJECT_STORE_HPP
#define FOLIO_OBJECT_STORE_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace folio {
namespace upload {

using WallClock = std::function<std::chrono::system_clock::time_point()>;

// Backend error codes the coordinator interprets
constexpr const char* kNoSuchUpload = "NoSuchUpload";
constexpr const char* kNoSuchKey = "NoSuchKey";

/**
 * Fields shared by every object store result
 */
struct StoreResult {
  bool success = false;
  std::string error_message;  // Error message if failed
  std::string error_code;     // Backend error code for classification
  bool is_retryable = false;  // True for transient errors

  static StoreResult Success() {
    StoreResult result;
    result.success = true;
    return result;
  }

  /**
   * Failed result of any store result type
   */
  template<typename R = StoreResult>
  static R Failure(const std::string& message, const std::string& code = "", bool retryable = false) {
    R result;
    result.success = false;
    result.error_message = message;
    result.error_code = code;
    result.is_retryable = retryable;
    return result;
  }
};

/**
 * An in-progress multipart upload as reported by the backend
 */
struct MultipartUploadInfo {
  std::string key;
  std::string upload_id;
  std::chrono::system_clock::time_point initiated;
};

/**
 * A stored part as reported by the backend
 */
struct PartInfo {
  int part_number = 0;
  std::string etag;
  uint64_t size = 0;
};

/**
 * Manifest entry for completion
 */
struct CompletedPart {
  int part_number = 0;
  std::string etag;
};

struct CreateUploadResult : StoreResult {
  std::string upload_id;

  static CreateUploadResult Success(const std::string& upload_id) {
    CreateUploadResult result;
    result.success = true;
    result.upload_id = upload_id;
    return result;
  }
};

/**
 * One page of in-progress uploads. When is_truncated, pass the next_* markers
 * to fetch the following page.
 */
struct ListUploadsResult : StoreResult {
  std::vector<MultipartUploadInfo> uploads;
  bool is_truncated = false;
  std::string next_key_marker;
  std::string next_upload_id_marker;
};

/**
 * One page of parts, ordered by part number
 */
struct ListPartsResult : StoreResult {
  std::vector<PartInfo> parts;
  bool is_truncated = false;
  int next_part_number_marker = 0;
};

struct PartUploadResult : StoreResult {
  std::string etag;

  static PartUploadResult Success(const std::string& etag) {
    PartUploadResult result;
    result.success = true;
    result.etag = etag;
    return result;
  }
};

struct CompleteUploadResult : StoreResult {
  std::string key;
  std::string location;  // URL of the finished object
  std::string etag;
};

/**
 * HEAD of an object. success with found == false means the key does not exist.
 */
struct HeadObjectResult : StoreResult {
  bool found = false;
  uint64_t size = 0;
  std::string etag;
  std::chrono::system_clock::time_point last_modified;
};

struct PresignResult : StoreResult {
  std::string url;
};

/**
 * Multipart-upload capabilities of an S3-compatible object store.
 *
 * The backend is the only record of upload sessions. Implementations are
 * called concurrently and must be thread-safe.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  virtual CreateUploadResult createMultipartUpload(const std::string& key) = 0;

  /**
   * List in-progress uploads whose key starts with prefix, one page per call.
   * Empty markers request the first page.
   */
  virtual ListUploadsResult listMultipartUploads(
    const std::string& prefix, const std::string& key_marker, const std::string& upload_id_marker
  ) = 0;

  /**
   * List parts of an upload with part number greater than part_number_marker.
   * Fails with kNoSuchUpload once the upload is completed, aborted or expired.
   */
  virtual ListPartsResult listParts(
    const std::string& key, const std::string& upload_id, int part_number_marker
  ) = 0;

  /**
   * Store one part. Uploading an existing part number replaces it.
   */
  virtual PartUploadResult uploadPart(
    const std::string& key, const std::string& upload_id, int part_number,
    const std::vector<uint8_t>& bytes
  ) = 0;

  virtual CompleteUploadResult completeMultipartUpload(
    const std::string& key, const std::string& upload_id, const std::vector<CompletedPart>& parts
  ) = 0;

  virtual StoreResult abortMultipartUpload(const std::string& key, const std::string& upload_id) = 0;

  virtual HeadObjectResult headObject(const std::string& key) = 0;

  /**
   * Time-limited GET URL for a stored object
   */
  virtual PresignResult presignGetObject(const std::string& key, std::chrono::seconds ttl) = 0;
};

/**
 * Follow listMultipartUploads pages until the listing is exhausted.
 * The returned result is never truncated.
 */
ListUploadsResult listAllUploads(IObjectStore& store, const std::string& prefix);

/**
 * Follow listParts pages until the listing is exhausted.
 */
ListPartsResult listAllParts(
  IObjectStore& store, const std::string& key, const std::string& upload_id
);

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_OBJECT_STORE_HPP
