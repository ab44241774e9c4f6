// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_CLI_CONFIG_PARSER_HPP
#define HOIST_CLI_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

#include "hoist_log_init.hpp"
#include "s3_object_store.hpp"
#include "transfer_manager.hpp"

namespace hoist {
namespace cli {

struct TransferSection {
  std::string name = "hoist";
  uint64_t multipart_threshold_mb = 8;
  uint64_t part_size_mb = 8;
  int max_concurrency = 4;
  bool abort_on_failure = true;
  int resume_check_timeout_ms = 60000;
  int resume_check_max_attempts = 10;
  int resume_check_delay_ms = 100;
};

struct RetrySection {
  int max_retries = 3;
  int initial_delay_ms = 200;
  int max_delay_ms = 20000;
  double exponential_base = 2.0;
  bool jitter = true;
};

// The logging library resolves and validates these itself
using LoggingSection = ::hoist::logging::LogSettings;

struct StateSection {
  std::string db_path = "/var/lib/hoist/paused_uploads.db";
};

struct HoistConfig {
  std::string store = "s3";  // "s3" or "memory"
  transfer::S3StoreConfig s3;
  TransferSection transfer;
  RetrySection retry;
  LoggingSection logging;
  StateSection state;
};

/**
 * Build the TransferManager configuration from the transfer and retry sections
 */
transfer::TransferConfig to_transfer_config(const HoistConfig& config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, HoistConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, HoistConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const HoistConfig& config, std::string& error_msg);

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_s3(const YAML::Node& node, transfer::S3StoreConfig& s3);
  bool parse_transfer(const YAML::Node& node, TransferSection& transfer);
  bool parse_retry(const YAML::Node& node, RetrySection& retry);
  bool parse_logging(const YAML::Node& node, LoggingSection& logging);

  mutable std::string last_error_;
};

}  // namespace cli
}  // namespace hoist

#endif  // HOIST_CLI_CONFIG_PARSER_HPP
