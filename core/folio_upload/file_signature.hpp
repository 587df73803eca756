// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_FILE_SIGNATURE_HPP
#define FOLIO_FILE_SIGNATURE_HPP

#include <cstdint>
#include <string>

#include "upload_errors.hpp"
#include "upload_limits.hpp"

namespace folio {
namespace upload {

/**
 * Compute the content signature of a file from its client-visible identity.
 *
 * The signature is the first 16 lowercase hex characters of
 * SHA-256("{name}:{size}:{last_modified_ms}"), byte-for-byte what the browser
 * client derives with crypto.subtle.digest. It identifies an upload, it does
 * not authenticate one.
 *
 * @param name File name as reported by the client (UTF-8)
 * @param size File size in bytes
 * @param last_modified_ms Last modification time, milliseconds since epoch
 * @return 16-character lowercase hex signature
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string computeSignature(const std::string& name, uint64_t size, int64_t last_modified_ms);

/**
 * True if s is exactly 16 lowercase hex characters.
 */
bool isValidSignature(const std::string& s);

/**
 * Identity of a local file as the upload client sees it
 */
struct LocalFileInfo {
  std::string path;
  std::string name;  // final path component
  uint64_t size = 0;
  int64_t last_modified_ms = 0;
  std::string signature;
};

/**
 * Stat a local file and compute its signature.
 *
 * @return InvalidArgument if the path is missing or not a regular file
 */
Result<LocalFileInfo> inspectLocalFile(const std::string& path);

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_FILE_SIGNATURE_HPP
