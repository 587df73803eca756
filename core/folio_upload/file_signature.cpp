// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_signature.hpp"

#include <openssl/evp.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace folio {
namespace upload {

namespace {

// SHA-256 over data, returned as lowercase hex
std::string sha256Hex(const std::string& data) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
            EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
            EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
  EVP_MD_CTX_free(ctx);

  if (!ok) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < hash_len; ++i) {
    ss << std::setw(2) << static_cast<unsigned>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string computeSignature(const std::string& name, uint64_t size, int64_t last_modified_ms) {
  std::string identity = name + ":" + std::to_string(size) + ":" + std::to_string(last_modified_ms);
  return sha256Hex(identity).substr(0, kSignatureLength);
}

bool isValidSignature(const std::string& s) {
  if (s.size() != kSignatureLength) {
    return false;
  }
  for (char c : s) {
    bool hex_digit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex_digit) {
      return false;
    }
  }
  return true;
}

Result<LocalFileInfo> inspectLocalFile(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return Result<LocalFileInfo>::Failure(
      ErrorCode::InvalidArgument, "Cannot stat " + path + ": " + std::strerror(errno)
    );
  }
  if (!S_ISREG(st.st_mode)) {
    return Result<LocalFileInfo>::Failure(
      ErrorCode::InvalidArgument, "Not a regular file: " + path
    );
  }

  LocalFileInfo info;
  info.path = path;
  info.name = std::filesystem::path(path).filename().string();
  info.size = static_cast<uint64_t>(st.st_size);
  info.last_modified_ms =
    static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 + st.st_mtim.tv_nsec / 1000000;
  info.signature = computeSignature(info.name, info.size, info.last_modified_ms);
  return Result<LocalFileInfo>::Success(info);
}

}  // namespace upload
}  // namespace folio
