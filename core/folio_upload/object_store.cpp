// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "object_store.hpp"

#include <utility>

namespace folio {
namespace upload {

ListUploadsResult listAllUploads(IObjectStore& store, const std::string& prefix) {
  ListUploadsResult all;
  all.success = true;

  std::string key_marker;
  std::string upload_id_marker;
  while (true) {
    auto page = store.listMultipartUploads(prefix, key_marker, upload_id_marker);
    if (!page.success) {
      return page;
    }
    for (auto& upload : page.uploads) {
      all.uploads.push_back(std::move(upload));
    }
    if (!page.is_truncated) {
      break;
    }
    // A backend that repeats its markers would loop forever
    if (page.next_key_marker == key_marker && page.next_upload_id_marker == upload_id_marker) {
      return StoreResult::Failure<ListUploadsResult>(
        "Upload listing did not advance past key marker '" + key_marker + "'", "InvalidPagination"
      );
    }
    key_marker = page.next_key_marker;
    upload_id_marker = page.next_upload_id_marker;
  }
  return all;
}

ListPartsResult listAllParts(
  IObjectStore& store, const std::string& key, const std::string& upload_id
) {
  ListPartsResult all;
  all.success = true;

  int marker = 0;
  while (true) {
    auto page = store.listParts(key, upload_id, marker);
    if (!page.success) {
      return page;
    }
    for (auto& part : page.parts) {
      all.parts.push_back(std::move(part));
    }
    if (!page.is_truncated) {
      break;
    }
    if (page.next_part_number_marker <= marker) {
      return StoreResult::Failure<ListPartsResult>(
        "Part listing did not advance past part " + std::to_string(marker), "InvalidPagination"
      );
    }
    marker = page.next_part_number_marker;
  }
  return all;
}

}  // namespace upload
}  // namespace folio
