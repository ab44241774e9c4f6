// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_LOG_SEVERITY_HPP
#define HOIST_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>

namespace hoist {
namespace logging {

/**
 * Severity levels for hoist logging.
 * FATAL is reserved for conditions that end the process.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  static const char* strings[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  if (static_cast<size_t>(level) < sizeof(strings) / sizeof(*strings))
    strm << strings[static_cast<size_t>(level)];
  else
    strm << static_cast<int>(level);
  return strm;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace hoist

#endif  // HOIST_LOG_SEVERITY_HPP
