// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>

namespace hoist {
namespace cli {

namespace {

// S3 rejects parts below 5 MB except the last one
constexpr uint64_t kS3MinPartSizeMb = 5;

}  // namespace

transfer::TransferConfig to_transfer_config(const HoistConfig& config) {
  transfer::TransferConfig result;
  result.name = config.transfer.name;
  result.multipart_threshold_bytes = config.transfer.multipart_threshold_mb * 1024 * 1024;
  result.part_size_bytes = config.transfer.part_size_mb * 1024 * 1024;
  result.max_concurrency = static_cast<size_t>(config.transfer.max_concurrency);
  result.abort_on_failure = config.transfer.abort_on_failure;

  result.retry.max_retries = config.retry.max_retries;
  result.retry.initial_delay = std::chrono::milliseconds(config.retry.initial_delay_ms);
  result.retry.max_delay = std::chrono::milliseconds(config.retry.max_delay_ms);
  result.retry.exponential_base = config.retry.exponential_base;
  result.retry.jitter = config.retry.jitter;

  result.resume_check.max_attempts = config.transfer.resume_check_max_attempts;
  result.resume_check.wait_timeout =
    std::chrono::milliseconds(config.transfer.resume_check_timeout_ms);
  result.resume_check.backoff = transfer::fixedDelayRetryConfig(
    std::chrono::milliseconds(config.transfer.resume_check_delay_ms), 0
  );
  return result;
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, HoistConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, HoistConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["store"]) {
      config.store = node["store"].as<std::string>();
    }

    if (node["s3"]) {
      parse_s3(node["s3"], config.s3);
    }

    if (node["transfer"]) {
      parse_transfer(node["transfer"], config.transfer);
    }

    if (node["retry"]) {
      parse_retry(node["retry"], config.retry);
    }

    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }

    if (node["state"] && node["state"]["db_path"]) {
      config.state.db_path = node["state"]["db_path"].as<std::string>();
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_s3(const YAML::Node& node, transfer::S3StoreConfig& s3) {
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_transfer(const YAML::Node& node, TransferSection& transfer) {
  if (node["name"]) {
    transfer.name = node["name"].as<std::string>();
  }
  if (node["multipart_threshold_mb"]) {
    transfer.multipart_threshold_mb = node["multipart_threshold_mb"].as<uint64_t>();
  }
  if (node["part_size_mb"]) {
    transfer.part_size_mb = node["part_size_mb"].as<uint64_t>();
  }
  if (node["max_concurrency"]) {
    transfer.max_concurrency = node["max_concurrency"].as<int>();
  }
  if (node["abort_on_failure"]) {
    transfer.abort_on_failure = node["abort_on_failure"].as<bool>();
  }
  if (node["resume_check_timeout_ms"]) {
    transfer.resume_check_timeout_ms = node["resume_check_timeout_ms"].as<int>();
  }
  if (node["resume_check_max_attempts"]) {
    transfer.resume_check_max_attempts = node["resume_check_max_attempts"].as<int>();
  }
  if (node["resume_check_delay_ms"]) {
    transfer.resume_check_delay_ms = node["resume_check_delay_ms"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetrySection& retry) {
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay_ms = node["initial_delay_ms"].as<int>();
  }
  if (node["max_delay_ms"]) {
    retry.max_delay_ms = node["max_delay_ms"].as<int>();
  }
  if (node["exponential_base"]) {
    retry.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSection& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<int>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
  }

  return true;
}

bool ConfigParser::validate(const HoistConfig& config, std::string& error_msg) {
  if (config.store != "s3" && config.store != "memory") {
    error_msg = "Invalid store - must be 's3' or 'memory'";
    return false;
  }

  if (config.store == "s3" && !config.s3.endpoint_url.empty()) {
    if (config.s3.endpoint_url.find("http://") != 0 &&
        config.s3.endpoint_url.find("https://") != 0) {
      error_msg = "Invalid s3.endpoint_url - must start with http:// or https://";
      return false;
    }
  }

  if (config.transfer.max_concurrency < 1 || config.transfer.max_concurrency > 64) {
    error_msg = "Invalid transfer.max_concurrency - must be between 1 and 64";
    return false;
  }

  if (config.transfer.part_size_mb == 0) {
    error_msg = "Invalid transfer.part_size_mb - must be > 0";
    return false;
  }

  if (config.store == "s3" && config.transfer.part_size_mb < kS3MinPartSizeMb) {
    error_msg = "Invalid transfer.part_size_mb - S3 requires at least 5 MB";
    return false;
  }

  if (config.transfer.resume_check_max_attempts < 1) {
    error_msg = "Invalid transfer.resume_check_max_attempts - must be >= 1";
    return false;
  }

  if (config.transfer.resume_check_timeout_ms < 0 || config.transfer.resume_check_delay_ms < 0) {
    error_msg = "Invalid resume check timing - values must be >= 0";
    return false;
  }

  if (config.retry.max_retries < 0 || config.retry.max_retries > 100) {
    error_msg = "Invalid retry.max_retries - must be between 0 and 100";
    return false;
  }

  if (config.retry.initial_delay_ms < 0) {
    error_msg = "Invalid retry.initial_delay_ms - must be >= 0";
    return false;
  }

  if (config.retry.max_delay_ms < config.retry.initial_delay_ms) {
    error_msg = "Invalid retry.max_delay_ms - must be >= initial_delay_ms";
    return false;
  }

  std::string logging_error;
  if (!::hoist::logging::resolve_logging_config(config.logging, logging_error)) {
    error_msg = logging_error;
    return false;
  }

  if (config.state.db_path.empty()) {
    error_msg = "state.db_path is empty";
    return false;
  }

  return true;
}

}  // namespace cli
}  // namespace hoist
