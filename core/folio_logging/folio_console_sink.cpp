// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "folio_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <string>

#include "folio_log_context.hpp"

namespace folio {
namespace logging {

namespace {

// ANSI color per severity, indexed by the enum value
constexpr const char* kLevelColors[] = {
  "\033[36m",  // debug: cyan
  "\033[32m",  // info: green
  "\033[33m",  // warn: yellow
  "\033[31m",  // error: red
  "\033[35m",  // fatal: magenta
};
constexpr const char* kResetColor = "\033[0m";

class ConsoleFormatter {
public:
  explicit ConsoleFormatter(bool use_colors)
      : use_colors_(use_colors) {}

  void operator()(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) const {
    RecordFields fields = extract_fields(rec);

    strm << "[";
    if (fields.timestamp) {
      strm << *fields.timestamp;
    }
    strm << "] ";

    if (fields.severity) {
      auto index = static_cast<size_t>(*fields.severity);
      bool colored = use_colors_ && index < sizeof(kLevelColors) / sizeof(*kLevelColors);
      if (colored) {
        strm << kLevelColors[index];
      }
      strm << "[" << *fields.severity << "]";
      if (colored) {
        strm << kResetColor;
      }
      strm << " ";
    }

    strm << rec[boost::log::expressions::smessage];
    write_upload_context(fields, strm);
  }

private:
  bool use_colors_;
};

}  // namespace

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(ConsoleFormatter(use_colors));
  return sink;
}

}  // namespace logging
}  // namespace folio
