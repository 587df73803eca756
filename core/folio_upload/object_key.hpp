// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_OBJECT_KEY_HPP
#define FOLIO_OBJECT_KEY_HPP

#include <optional>
#include <string>

#include "upload_errors.hpp"

namespace folio {
namespace upload {

/**
 * Parts of an object key of the form uploads/{signature}/{encoded_name}
 */
struct DecodedKey {
  std::string signature;
  std::string file_name;  // URL-decoded
};

/**
 * Build the object key for a file.
 *
 * @return MalformedKey for an invalid signature or empty name,
 *         KeyTooLong if the key exceeds kMaxKeyLength bytes
 */
Result<std::string> encodeKey(const std::string& signature, const std::string& file_name);

/**
 * Split an object key back into signature and file name.
 *
 * @return MalformedKey unless the key is exactly three segments
 *         "uploads", a valid signature and a decodable non-empty name
 */
Result<DecodedKey> decodeKey(const std::string& key);

/**
 * Listing prefix covering every key of a signature: uploads/{signature}/
 */
std::string signaturePrefix(const std::string& signature);

/**
 * Percent-encode every byte outside the RFC 3986 unreserved set, uppercase hex.
 */
std::string urlEncode(const std::string& value);

/**
 * Reverse of urlEncode. std::nullopt on a truncated or non-hex escape.
 */
std::optional<std::string> urlDecode(const std::string& value);

}  // namespace upload
}  // namespace folio

#endif  // FOLIO_OBJECT_KEY_HPP
