// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/AWSError.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/DateTime.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListMultipartUploadsRequest.h>
#include <aws/s3/model/ListPartsRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <cctype>
#include <cstdlib>
#include <mutex>

#include "retry_handler.hpp"

#define FOLIO_LOG_COMPONENT "s3_object_store"
#include <folio_log_macros.hpp>

namespace folio {
namespace upload {

using ::folio::logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must bracket every SDK object in the process. Stores
// share one reference-counted initialization.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

namespace {

// Map an SDK error onto a store result, normalizing session-gone errors
template<typename R, typename E>
R failureFrom(const Aws::Client::AWSError<E>& error, const char* operation) {
  std::string code = error.GetExceptionName();
  if (error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_UPLOAD) {
    code = kNoSuchUpload;
  } else if (code.empty()) {
    code = "HTTP" + std::to_string(static_cast<int>(error.GetResponseCode()));
  }

  std::string message = error.GetMessage();
  if (message.empty()) {
    message = std::string(operation) + " failed";
  }
  bool retryable = RetryHandler::isRetryableError(code) || error.ShouldRetry();

  FOLIO_LOG_DEBUG(
    operation << " failed" << kv("code", code) << kv("message", message)
              << kv("retryable", retryable)
  );
  return StoreResult::Failure<R>(message, code, retryable);
}

std::string stripQuotes(std::string etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    etag = etag.substr(1, etag.size() - 2);
  }
  return etag;
}

std::string contentTypeFor(const std::string& key) {
  if (key.size() >= 4) {
    std::string ext = key.substr(key.size() - 4);
    for (auto& c : ext) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == ".pdf") {
      return "application/pdf";
    }
  }
  return "application/octet-stream";
}

}  // namespace

// =============================================================================
// S3ObjectStore Implementation
// =============================================================================

class S3ObjectStore::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // The client must be gone before release() may shut the SDK down
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("FolioS3", config.max_sdk_retries);

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Custom endpoints (MinIO and friends) need path-style addressing
    bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

S3ObjectStore::S3ObjectStore(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  FOLIO_LOG_INFO(
    "S3 store ready" << kv("bucket", impl_->config.bucket)
                     << kv("endpoint", impl_->config.endpoint_url)
  );
}

S3ObjectStore::~S3ObjectStore() = default;

CreateUploadResult S3ObjectStore::createMultipartUpload(const std::string& key) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetContentType(contentTypeFor(key));

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom<CreateUploadResult>(outcome.GetError(), "CreateMultipartUpload");
  }
  return CreateUploadResult::Success(outcome.GetResult().GetUploadId());
}

ListUploadsResult S3ObjectStore::listMultipartUploads(
  const std::string& prefix, const std::string& key_marker, const std::string& upload_id_marker
) {
  Aws::S3::Model::ListMultipartUploadsRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetPrefix(prefix);
  if (!key_marker.empty()) {
    request.SetKeyMarker(key_marker);
  }
  if (!upload_id_marker.empty()) {
    request.SetUploadIdMarker(upload_id_marker);
  }

  auto outcome = impl_->client->ListMultipartUploads(request);
  if (!outcome.IsSuccess()) {
    return failureFrom<ListUploadsResult>(outcome.GetError(), "ListMultipartUploads");
  }

  const auto& page = outcome.GetResult();
  ListUploadsResult result;
  result.success = true;
  for (const auto& upload : page.GetUploads()) {
    MultipartUploadInfo info;
    info.key = upload.GetKey();
    info.upload_id = upload.GetUploadId();
    info.initiated = upload.GetInitiated().UnderlyingTimestamp();
    result.uploads.push_back(std::move(info));
  }
  result.is_truncated = page.GetIsTruncated();
  result.next_key_marker = page.GetNextKeyMarker();
  result.next_upload_id_marker = page.GetNextUploadIdMarker();
  return result;
}

ListPartsResult S3ObjectStore::listParts(
  const std::string& key, const std::string& upload_id, int part_number_marker
) {
  Aws::S3::Model::ListPartsRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  if (part_number_marker > 0) {
    request.SetPartNumberMarker(part_number_marker);
  }

  auto outcome = impl_->client->ListParts(request);
  if (!outcome.IsSuccess()) {
    return failureFrom<ListPartsResult>(outcome.GetError(), "ListParts");
  }

  const auto& page = outcome.GetResult();
  ListPartsResult result;
  result.success = true;
  for (const auto& part : page.GetParts()) {
    PartInfo info;
    info.part_number = part.GetPartNumber();
    info.etag = part.GetETag();
    info.size = static_cast<uint64_t>(part.GetSize());
    result.parts.push_back(std::move(info));
  }
  result.is_truncated = page.GetIsTruncated();
  result.next_part_number_marker = static_cast<int>(page.GetNextPartNumberMarker());
  return result;
}

PartUploadResult S3ObjectStore::uploadPart(
  const std::string& key, const std::string& upload_id, int part_number,
  const std::vector<uint8_t>& bytes
) {
  auto body = Aws::MakeShared<Aws::StringStream>("FolioUploadPart");
  body->write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));

  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(part_number);
  request.SetContentLength(static_cast<long long>(bytes.size()));
  request.SetBody(body);

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return failureFrom<PartUploadResult>(outcome.GetError(), "UploadPart");
  }
  return PartUploadResult::Success(outcome.GetResult().GetETag());
}

CompleteUploadResult S3ObjectStore::completeMultipartUpload(
  const std::string& key, const std::string& upload_id, const std::vector<CompletedPart>& parts
) {
  Aws::S3::Model::CompletedMultipartUpload manifest;
  for (const auto& part : parts) {
    manifest.AddParts(
      Aws::S3::Model::CompletedPart().WithPartNumber(part.part_number).WithETag(part.etag)
    );
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(manifest);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom<CompleteUploadResult>(outcome.GetError(), "CompleteMultipartUpload");
  }

  const auto& done = outcome.GetResult();
  CompleteUploadResult result;
  result.success = true;
  result.key = done.GetKey();
  result.location = done.GetLocation();
  result.etag = stripQuotes(done.GetETag());
  return result;
}

StoreResult S3ObjectStore::abortMultipartUpload(
  const std::string& key, const std::string& upload_id
) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom<StoreResult>(outcome.GetError(), "AbortMultipartUpload");
  }
  return StoreResult::Success();
}

HeadObjectResult S3ObjectStore::headObject(const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  HeadObjectResult result;
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    // HEAD has no body, so a missing key only shows as 404
    if (error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND ||
        error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY ||
        error.GetErrorType() == Aws::S3::S3Errors::RESOURCE_NOT_FOUND) {
      result.success = true;
      result.found = false;
      return result;
    }
    return failureFrom<HeadObjectResult>(error, "HeadObject");
  }

  const auto& head = outcome.GetResult();
  result.success = true;
  result.found = true;
  result.size = static_cast<uint64_t>(head.GetContentLength());
  result.etag = stripQuotes(head.GetETag());
  result.last_modified = head.GetLastModified().UnderlyingTimestamp();
  return result;
}

PresignResult S3ObjectStore::presignGetObject(const std::string& key, std::chrono::seconds ttl) {
  Aws::String url = impl_->client->GeneratePresignedUrl(
    impl_->config.bucket, key, Aws::Http::HttpMethod::HTTP_GET, static_cast<uint64_t>(ttl.count())
  );
  if (url.empty()) {
    return StoreResult::Failure<PresignResult>("Could not presign URL for " + key, "PresignFailed");
  }

  PresignResult result;
  result.success = true;
  result.url = url;
  return result;
}

const std::string& S3ObjectStore::bucket() const {
  return impl_->config.bucket;
}

const std::string& S3ObjectStore::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace upload
}  // namespace folio
