// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "hoist_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <utility>
#include <vector>

#include "hoist_log_macros.hpp"

namespace hoist {
namespace logging {

namespace {

/**
 * Every sink hoist attached to the Boost.Log core.
 *
 * The console and file sinks are kept by type so shutdown can stop their
 * feeding threads before they are detached.
 */
class SinkRegistry {
public:
  static SinkRegistry& instance() {
    static SinkRegistry registry;
    return registry;
  }

  void install(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
      return;
    }

    // TimeStamp and ThreadID for every record
    boost::log::add_common_attributes();

    if (config.console_enabled) {
      console_ = create_console_sink(config.console_level, config.console_colors);
      attachLocked(console_);
    }
    if (config.file_enabled) {
      file_ = create_file_sink(config.file_config, config.file_level);
      attachLocked(file_);
    }
    initialized_ = true;
  }

  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      return;
    }

    // Stopping drains the async queues
    if (console_) {
      console_->stop();
      console_->flush();
    }
    if (file_) {
      file_->stop();
      file_->flush();
    }

    auto core = boost::log::core::get();
    for (auto& sink : sinks_) {
      core->remove_sink(sink);
    }
    sinks_.clear();
    console_.reset();
    file_.reset();
    initialized_ = false;
  }

  void add(boost::shared_ptr<boost::log::sinks::sink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    attachLocked(std::move(sink));
  }

  void remove(const boost::shared_ptr<boost::log::sinks::sink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    boost::log::core::get()->remove_sink(sink);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
  }

  void flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (console_) {
      console_->flush();
    }
    if (file_) {
      file_->flush();
    }
  }

  bool initialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
  }

private:
  SinkRegistry() = default;

  void attachLocked(boost::shared_ptr<boost::log::sinks::sink> sink) {
    boost::log::core::get()->add_sink(sink);
    sinks_.push_back(std::move(sink));
  }

  std::mutex mutex_;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> sinks_;
  boost::shared_ptr<async_console_sink_t> console_;
  boost::shared_ptr<async_file_sink_t> file_;
  bool initialized_ = false;
};

std::string to_lower(const std::string& s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return result;
}

std::optional<std::string> get_env(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

// "json" or "text"
std::optional<bool> parse_format_json(const std::string& format) {
  std::string lower = to_lower(format);
  if (lower == "json") {
    return true;
  }
  if (lower == "text") {
    return false;
  }
  return std::nullopt;
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);

  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  } else if (lower == "error") {
    return severity_level::error;
  } else if (lower == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

std::optional<LoggingConfig> resolve_logging_config(
  const LogSettings& settings, std::string& error_msg
) {
  LoggingConfig config;

  auto console_level = parse_severity_level(settings.console_level);
  if (!console_level) {
    error_msg = "Invalid logging.console.level '" + settings.console_level + "'";
    return std::nullopt;
  }
  auto file_level = parse_severity_level(settings.file_level);
  if (!file_level) {
    error_msg = "Invalid logging.file.level '" + settings.file_level + "'";
    return std::nullopt;
  }
  auto format_json = parse_format_json(settings.file_format);
  if (!format_json) {
    error_msg = "Invalid logging.file.format '" + settings.file_format +
                "' - must be 'json' or 'text'";
    return std::nullopt;
  }
  if (settings.file_enabled && settings.file_directory.empty()) {
    error_msg = "logging.file.directory is empty";
    return std::nullopt;
  }
  if (settings.max_files < 1) {
    error_msg = "Invalid logging.file.max_files - must be >= 1";
    return std::nullopt;
  }
  if (settings.rotation_size_mb == 0) {
    error_msg = "Invalid logging.file.rotation_size_mb - must be > 0";
    return std::nullopt;
  }

  config.console_enabled = settings.console_enabled;
  config.console_colors = settings.console_colors;
  config.console_level = settings.verbose ? severity_level::debug : *console_level;

  config.file_enabled = settings.file_enabled;
  config.file_level = *file_level;
  config.file_config.directory = settings.file_directory;
  config.file_config.format_json = *format_json;
  config.file_config.max_files = settings.max_files;
  config.file_config.rotation_size_mb = settings.rotation_size_mb;
  return config;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto level_str = get_env("HOIST_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*level_str)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }

  // Per-sink variables take precedence over HOIST_LOG_LEVEL
  if (auto level_str = get_env("HOIST_LOG_CONSOLE_LEVEL")) {
    if (auto level = parse_severity_level(*level_str)) {
      config.console_level = *level;
    }
  }
  if (auto level_str = get_env("HOIST_LOG_FILE_LEVEL")) {
    if (auto level = parse_severity_level(*level_str)) {
      config.file_level = *level;
    }
  }

  if (auto enabled_str = get_env("HOIST_LOG_CONSOLE_ENABLED")) {
    if (auto enabled = parse_bool(*enabled_str)) {
      config.console_enabled = *enabled;
    }
  }
  if (auto enabled_str = get_env("HOIST_LOG_FILE_ENABLED")) {
    if (auto enabled = parse_bool(*enabled_str)) {
      config.file_enabled = *enabled;
    }
  }

  if (auto dir = get_env("HOIST_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = get_env("HOIST_LOG_FORMAT")) {
    if (auto format_json = parse_format_json(*format)) {
      config.file_config.format_json = *format_json;
    }
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  SinkRegistry::instance().install(config);
}

bool init_logging(const LogSettings& settings, std::string& error_msg) {
  auto config = resolve_logging_config(settings, error_msg);
  if (!config) {
    return false;
  }
  apply_env_overrides(*config);
  init_logging(*config);
  return true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  SinkRegistry::instance().shutdown();
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  SinkRegistry::instance().add(std::move(sink));
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  SinkRegistry::instance().remove(sink);
}

void flush_logging() {
  SinkRegistry::instance().flush();
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig final_config = config;
  apply_env_overrides(final_config);
  shutdown_logging();
  init_logging(final_config);
}

bool is_logging_initialized() {
  return SinkRegistry::instance().initialized();
}

}  // namespace logging
}  // namespace hoist
