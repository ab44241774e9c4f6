// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_FILE_SINK_HPP
#define HOIST_FILE_SINK_HPP

#include <boost/filesystem/path.hpp>
#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "hoist_log_severity.hpp"

namespace hoist {
namespace logging {

/**
 * Async file sink with bounded queue.
 * Larger queue than the console sink because disk I/O is slower.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * File sink configuration.
 */
struct FileSinkConfig {
  std::string directory = "/var/log/hoist";
  std::string file_pattern = "hoist_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 100;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = true;
};

/**
 * Return @p directory, creating it if needed. When it cannot be created the
 * result is "hoist" under the system temp directory.
 */
boost::filesystem::path resolve_log_directory(const std::string& directory);

/**
 * Create async rotating file sink.
 * Records are one JSON object per line, or plain text when format_json is off.
 *
 * @param config File sink configuration
 * @param min_level Minimum severity level to log
 * @return Shared pointer to the sink
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace hoist

#endif  // HOIST_FILE_SINK_HPP
