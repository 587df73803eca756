// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_LOG_MACROS_HPP
#define FOLIO_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include <boost/log/utility/unused_variable.hpp>
#include <boost/preprocessor/cat.hpp>

#include <sstream>
#include <string>

#include "folio_log_severity.hpp"

namespace folio {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger, defined in folio_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value field for structured messages.
 * Usage: FOLIO_LOG_INFO("part uploaded" << kv("part", n));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace folio

// Define FOLIO_LOG_COMPONENT before including this header to tag records
// with the emitting component.
#ifndef FOLIO_LOG_COMPONENT
#define FOLIO_LOG_COMPONENT "folio"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define FOLIO_LOG_ENABLE_DEBUG 0
#else
#define FOLIO_LOG_ENABLE_DEBUG 1
#endif

// Every record carries a "Component" attribute and a "[component] " message prefix
#define FOLIO_LOG_AT(level, msg) \
  do { \
    BOOST_LOG_SEV(::folio::logging::get_logger(), ::folio::logging::severity_level::level) \
      << ::boost::log::add_value("Component", std::string(FOLIO_LOG_COMPONENT)) << "[" \
      << FOLIO_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define FOLIO_LOG_DEBUG(msg) \
  do { \
    if (FOLIO_LOG_ENABLE_DEBUG) { \
      FOLIO_LOG_AT(debug, msg); \
    } \
  } while (0)

#define FOLIO_LOG_INFO(msg) FOLIO_LOG_AT(info, msg)
#define FOLIO_LOG_WARN(msg) FOLIO_LOG_AT(warn, msg)
#define FOLIO_LOG_ERROR(msg) FOLIO_LOG_AT(error, msg)
#define FOLIO_LOG_FATAL(msg) FOLIO_LOG_AT(fatal, msg)

// Attach upload identity to every record emitted in the enclosing scope.
// Usage: FOLIO_LOG_SCOPED_CONTEXT(upload_id, signature);
#define FOLIO_LOG_SCOPED_CONTEXT(upload_id_val, signature_val) \
  BOOST_LOG_UNUSED_VARIABLE( \
    ::boost::log::scoped_attribute, BOOST_PP_CAT(folio_log_upload_ctx_, __LINE__), \
    = ::boost::log::add_scoped_thread_attribute( \
      "UploadID", boost::log::attributes::constant<std::string>(upload_id_val) \
    ) \
  ); \
  BOOST_LOG_UNUSED_VARIABLE( \
    ::boost::log::scoped_attribute, BOOST_PP_CAT(folio_log_signature_ctx_, __LINE__), \
    = ::boost::log::add_scoped_thread_attribute( \
      "Signature", boost::log::attributes::constant<std::string>(signature_val) \
    ) \
  )

#endif  // FOLIO_LOG_MACROS_HPP
