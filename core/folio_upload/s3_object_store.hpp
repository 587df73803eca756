// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_S3_OBJECT_STORE_HPP
#define FOLIO_S3_OBJECT_STORE_HPP

#include <memory>
#include <string>

#include "object_store.hpp"

namespace folio {
namespace upload {

/**
 * S3 connection options
 */
struct S3Config {
  std::string endpoint_url;  // e.g. "http://localhost:9000"; empty for AWS S3
  std::string bucket;
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // a 5 GiB part can take minutes

  // Chunk retries belong to the caller, so the SDK does not retry by default
  int max_sdk_retries = 0;
};

/**
 * IObjectStore over the AWS SDK for C++.
 *
 * Works with AWS S3 and S3-compatible stores (MinIO, Garage); a custom
 * endpoint switches to path-style addressing. One SDK client is shared by
 * all calls and is thread-safe.
 */
class S3ObjectStore : public IObjectStore {
public:
  explicit S3ObjectStore(const S3Config& config);
  ~S3ObjectStore() override;

  // Non-copyable, non-movable
  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;
  S3ObjectStore(S3ObjectStore&&) = delete;
  S3ObjectStore& operator=(S3ObjectStore&&) = delete;

  CreateUploadResult createMultipartUpload(const std::string& key) override;

  ListUploadsResult listMultipartUploads(
    const std::string& prefix, const std::string& key_marker, const std::string& upload_id_marker
  ) override;

  ListPartsResult listParts(
    const std::string& key, const std::string& upload_id, int part_number_marker
  ) override;

  PartUploadResult uploadPart(
    const std::string& key, const std::string& upload_id, int part_number,
    const std::vector<uint8_t>& bytes
  ) override;

  CompleteUploadResult completeMultipartUpload(
    const std::string& key, const std::string& upload_id, const std::vector<CompletedPart>& parts
  ) override;

  StoreResult abortMultipartUpload(const std::string& key, const std::string& upload_id) override;

  HeadObjectResult headObject(const std::string& key) override;

  PresignResult presignGetObject(const std::string& key, std::chrono::seconds ttl) override;

  const std::string& bucket() const;

  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_S3_OBJECT_STORE_HPP
