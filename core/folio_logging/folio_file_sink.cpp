// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "folio_file_sink.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>

#include "folio_log_context.hpp"

namespace folio {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

// Short escapes defined by RFC 8259; other control bytes use \u00XX
const char* short_escape(unsigned char c) {
  switch (c) {
    case '"':
      return "\\\"";
    case '\\':
      return "\\\\";
    case '\b':
      return "\\b";
    case '\f':
      return "\\f";
    case '\n':
      return "\\n";
    case '\r':
      return "\\r";
    case '\t':
      return "\\t";
    default:
      return nullptr;
  }
}

void write_json_field(boost::log::formatting_ostream& strm, const char* name, const std::string& value) {
  strm << ",\"" << name << "\":\"" << escape_json(value) << "\"";
}

std::string resolve_log_directory(const std::string& directory) {
  boost::filesystem::path dir_path(directory);
  if (boost::filesystem::exists(dir_path)) {
    return directory;
  }

  boost::system::error_code ec;
  boost::filesystem::create_directories(dir_path, ec);
  if (!ec) {
    return directory;
  }

  // The sink is being built, so stderr is the only channel
  std::cerr << "[folio_logging] Warning: Could not create log directory '" << directory
            << "': " << ec.message() << ". Falling back to /tmp\n";
  return "/tmp";
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    if (const char* escaped = short_escape(c)) {
      result += escaped;
    } else if (c < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", c);
      result += buf;
    } else {
      result += static_cast<char>(c);
    }
  }
  return result;
}

void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  RecordFields fields = extract_fields(rec);

  strm << "{\"ts\":\"";
  if (fields.timestamp) {
    strm << boost::posix_time::to_iso_extended_string(*fields.timestamp);
  }
  strm << "\",\"level\":\"";
  if (fields.severity) {
    strm << *fields.severity;
  }
  strm << "\"";

  if (fields.component) {
    write_json_field(strm, "component", *fields.component);
  }
  auto message = rec[boost::log::expressions::smessage];
  write_json_field(strm, "msg", message ? message.get() : std::string());
  if (fields.upload_id) {
    write_json_field(strm, "upload_id", *fields.upload_id);
  }
  if (fields.signature) {
    write_json_field(strm, "signature", *fields.signature);
  }
  strm << "}";
}

void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  RecordFields fields = extract_fields(rec);

  strm << "[";
  if (fields.timestamp) {
    strm << *fields.timestamp;
  }
  strm << "] ";
  if (fields.severity) {
    strm << "[" << *fields.severity << "] ";
  }
  strm << rec[boost::log::expressions::smessage];
  write_upload_context(fields, strm);
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string log_directory = resolve_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  // Old files beyond max_files are deleted on rotation
  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(config.format_json ? &json_formatter : &text_formatter);
  return sink;
}

}  // namespace logging
}  // namespace folio
