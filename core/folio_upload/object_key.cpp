// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "object_key.hpp"

#include <cstring>

#include "file_signature.hpp"
#include "upload_limits.hpp"

namespace folio {
namespace upload {

namespace {

bool isUnreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
         c == '_' || c == '.' || c == '~';
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string urlEncode(const std::string& value) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (isUnreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::optional<std::string> urlDecode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '%') {
      out.push_back(value[i]);
      continue;
    }
    if (i + 2 >= value.size()) {
      return std::nullopt;
    }
    int hi = hexValue(value[i + 1]);
    int lo = hexValue(value[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

std::string signaturePrefix(const std::string& signature) {
  return std::string(kUploadsPrefix) + signature + "/";
}

Result<std::string> encodeKey(const std::string& signature, const std::string& file_name) {
  if (!isValidSignature(signature)) {
    return Result<std::string>::Failure(
      ErrorCode::MalformedKey, "Invalid signature '" + signature + "'"
    );
  }
  if (file_name.empty()) {
    return Result<std::string>::Failure(ErrorCode::MalformedKey, "File name is empty");
  }

  std::string key = signaturePrefix(signature) + urlEncode(file_name);
  if (key.size() > kMaxKeyLength) {
    return Result<std::string>::Failure(
      ErrorCode::KeyTooLong,
      "Object key is " + std::to_string(key.size()) + " bytes, limit is " +
        std::to_string(kMaxKeyLength)
    );
  }
  return Result<std::string>::Success(key);
}

Result<DecodedKey> decodeKey(const std::string& key) {
  const size_t prefix_len = std::strlen(kUploadsPrefix);
  if (key.compare(0, prefix_len, kUploadsPrefix) != 0) {
    return Result<DecodedKey>::Failure(
      ErrorCode::MalformedKey, "Key does not start with " + std::string(kUploadsPrefix) + ": " + key
    );
  }

  size_t slash = key.find('/', prefix_len);
  if (slash == std::string::npos) {
    return Result<DecodedKey>::Failure(ErrorCode::MalformedKey, "Key has no file name: " + key);
  }
  std::string signature = key.substr(prefix_len, slash - prefix_len);
  std::string encoded_name = key.substr(slash + 1);

  if (encoded_name.find('/') != std::string::npos) {
    return Result<DecodedKey>::Failure(
      ErrorCode::MalformedKey, "Key has more than three segments: " + key
    );
  }
  if (!isValidSignature(signature)) {
    return Result<DecodedKey>::Failure(
      ErrorCode::MalformedKey, "Key has invalid signature segment: " + key
    );
  }
  if (encoded_name.empty()) {
    return Result<DecodedKey>::Failure(ErrorCode::MalformedKey, "Key has empty file name: " + key);
  }

  auto file_name = urlDecode(encoded_name);
  if (!file_name || file_name->empty()) {
    return Result<DecodedKey>::Failure(
      ErrorCode::MalformedKey, "Key has undecodable file name: " + key
    );
  }
  return Result<DecodedKey>::Success(DecodedKey{signature, *file_name});
}

}  // namespace upload
}  // namespace folio
