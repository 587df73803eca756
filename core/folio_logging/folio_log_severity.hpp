// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FOLIO_LOG_SEVERITY_HPP
#define FOLIO_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>

namespace folio {
namespace logging {

/**
 * Severity levels for folio logging.
 * FATAL is reserved for conditions that end the process.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

/**
 * Uppercase tag written by every sink, e.g. "WARN"
 */
inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
    case severity_level::fatal:
      return "FATAL";
  }
  return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << severity_name(level);
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace folio

#endif  // FOLIO_LOG_SEVERITY_HPP
