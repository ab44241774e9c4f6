// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_LOG_RECORD_HPP
#define HOIST_LOG_RECORD_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/optional.hpp>

#include <string>

#include "hoist_log_severity.hpp"

namespace hoist {
namespace logging {

/**
 * Attributes a hoist record may carry besides its message.
 *
 * Component comes from HOIST_LOG_COMPONENT at the call site; TransferID and
 * Object come from HOIST_LOG_SCOPED_TRANSFER on the emitting thread.
 */
struct RecordFields {
  boost::optional<severity_level> severity;
  boost::optional<std::string> component;
  boost::optional<std::string> transfer_id;
  boost::optional<std::string> object;
  std::string message;
};

RecordFields extract_record_fields(boost::log::record_view const& rec);

/**
 * Write "[ts] [level] [component] message | transfer_id=... object=..."
 *
 * @param level_color ANSI escape used around the level, or nullptr for none
 */
void write_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm,
  const char* level_color = nullptr
);

/**
 * Write one JSON object per record with ts, level, component, msg, thread_id
 * and, inside a transfer scope, transfer_id and object.
 */
void write_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

}  // namespace logging
}  // namespace hoist

#endif  // HOIST_LOG_RECORD_HPP
