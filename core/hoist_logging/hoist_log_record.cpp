// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "hoist_log_record.hpp"

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/support/date_time.hpp>

#include <cstdio>

namespace hoist {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

void write_timestamp(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
}

}  // namespace

RecordFields extract_record_fields(boost::log::record_view const& rec) {
  RecordFields fields;

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    fields.severity = *sev;
  }
  if (auto component = boost::log::extract<std::string>("Component", rec)) {
    fields.component = *component;
  }
  if (auto transfer_id = boost::log::extract<std::string>("TransferID", rec)) {
    fields.transfer_id = *transfer_id;
  }
  if (auto object = boost::log::extract<std::string>("Object", rec)) {
    fields.object = *object;
  }
  if (auto message = rec[expr::smessage]) {
    fields.message = *message;
  }
  return fields;
}

void write_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm,
  const char* level_color
) {
  const RecordFields fields = extract_record_fields(rec);

  strm << "[";
  write_timestamp(rec, strm);
  strm << "] ";

  if (fields.severity) {
    if (level_color) {
      strm << level_color << "[" << *fields.severity << "]\033[0m ";
    } else {
      strm << "[" << *fields.severity << "] ";
    }
  }
  if (fields.component) {
    strm << "[" << *fields.component << "] ";
  }

  strm << fields.message;

  if (fields.transfer_id || fields.object) {
    strm << " |";
    if (fields.transfer_id) strm << " transfer_id=" << *fields.transfer_id;
    if (fields.object) strm << " object=" << *fields.object;
  }
}

void write_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  const RecordFields fields = extract_record_fields(rec);

  strm << "{\"ts\":\"";
  write_timestamp(rec, strm);
  strm << "\",\"level\":\"";
  if (fields.severity) {
    strm << *fields.severity;
  }
  strm << "\"";

  if (fields.component) {
    strm << ",\"component\":\"" << escape_json(*fields.component) << "\"";
  }
  strm << ",\"msg\":\"" << escape_json(fields.message) << "\"";

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }

  // Lets a log collector group every line of one upload
  if (fields.transfer_id) {
    strm << ",\"transfer_id\":\"" << escape_json(*fields.transfer_id) << "\"";
  }
  if (fields.object) {
    strm << ",\"object\":\"" << escape_json(*fields.object) << "\"";
  }

  strm << "}";
}

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

}  // namespace logging
}  // namespace hoist
