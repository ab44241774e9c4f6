// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "hoist_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "hoist_log_record.hpp"

namespace hoist {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  write_json_record(rec, strm);
}

void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  write_text_record(rec, strm);
}

}  // namespace

boost::filesystem::path resolve_log_directory(const std::string& directory) {
  boost::filesystem::path dir_path(directory);
  if (boost::filesystem::is_directory(dir_path)) {
    return dir_path;
  }

  boost::system::error_code ec;
  boost::filesystem::create_directories(dir_path, ec);
  if (!ec) {
    return dir_path;
  }

  // Logging is not up yet, so report on stderr
  const std::string reason = ec.message();
  boost::filesystem::path fallback = boost::filesystem::temp_directory_path(ec) / "hoist";
  std::cerr << "[hoist_logging] Warning: Could not create log directory '" << directory
            << "': " << reason << ". Falling back to " << fallback.string() << "\n";
  boost::filesystem::create_directories(fallback, ec);
  return fallback;
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const boost::filesystem::path log_directory = resolve_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = (log_directory / config.file_pattern).string(),
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
}  // namespace hoist
