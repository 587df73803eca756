// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_UPLOAD_LIMITS_HPP
#define FOLIO_UPLOAD_LIMITS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace folio {
namespace upload {

// Backend limits for S3-compatible multipart uploads
constexpr uint64_t kMinPartSize = 5ULL * 1024 * 1024;               // 5 MiB (except last part)
constexpr uint64_t kMaxPartSize = 5ULL * 1024 * 1024 * 1024;        // 5 GiB
constexpr uint64_t kMaxObjectSize = 5ULL * 1024 * 1024 * 1024 * 1024;  // 5 TiB
constexpr int kMaxPartCount = 10000;
constexpr size_t kMaxKeyLength = 1024;

constexpr uint64_t kDefaultChunkSize = kMinPartSize;
constexpr size_t kSignatureLength = 16;

// All sessions and completed objects live under this prefix
constexpr const char* kUploadsPrefix = "uploads/";

constexpr std::chrono::seconds kDefaultUrlTtl{3600};
constexpr std::chrono::hours kDefaultMaxSessionAge{24};
// Ten years; larger ages are rejected by the CLI and config
constexpr std::chrono::hours kMaxSessionAge{24 * 365 * 10};
constexpr std::chrono::minutes kDefaultSweepInterval{60};

/**
 * Number of chunks of chunk_size needed to hold file_size bytes.
 */
inline uint64_t chunkCount(uint64_t file_size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    return 0;
  }
  return (file_size + chunk_size - 1) / chunk_size;
}

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_UPLOAD_LIMITS_HPP
