// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_LOG_CONTEXT_HPP
#define FOLIO_LOG_CONTEXT_HPP

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/optional.hpp>

#include <string>

#include "folio_log_severity.hpp"

namespace folio {
namespace logging {

/**
 * Attributes a sink formatter reads from one record.
 *
 * upload_id and signature are present inside FOLIO_LOG_SCOPED_CONTEXT;
 * component is set by every FOLIO_LOG_* macro.
 */
struct RecordFields {
  boost::optional<boost::posix_time::ptime> timestamp;
  boost::optional<severity_level> severity;
  boost::optional<std::string> component;
  boost::optional<std::string> upload_id;
  boost::optional<std::string> signature;

  bool has_upload_context() const {
    return upload_id || signature;
  }
};

inline RecordFields extract_fields(boost::log::record_view const& rec) {
  RecordFields fields;
  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    fields.timestamp = *ts;
  }
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    fields.severity = *sev;
  }
  if (auto component = boost::log::extract<std::string>("Component", rec)) {
    fields.component = *component;
  }
  if (auto upload_id = boost::log::extract<std::string>("UploadID", rec)) {
    fields.upload_id = *upload_id;
  }
  if (auto signature = boost::log::extract<std::string>("Signature", rec)) {
    fields.signature = *signature;
  }
  return fields;
}

/**
 * Trailing " | upload_id=... signature=..." for text formats
 */
inline void write_upload_context(const RecordFields& fields, boost::log::formatting_ostream& strm) {
  if (!fields.has_upload_context()) {
    return;
  }
  strm << " |";
  if (fields.upload_id) {
    strm << " upload_id=" << *fields.upload_id;
  }
  if (fields.signature) {
    strm << " signature=" << *fields.signature;
  }
}

}  // namespace logging
}  // namespace folio

#endif  // FOLIO_LOG_CONTEXT_HPP
