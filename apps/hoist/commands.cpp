// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "hoist_log_init.hpp"
#include "resume_token_store.hpp"
#include "s3_object_store.hpp"
#include "transfer_manager.hpp"
#include "transfer_progress.hpp"

#define HOIST_LOG_COMPONENT "cli"
#include <hoist_log_macros.hpp>

namespace fs = std::filesystem;

namespace hoist {
namespace cli {

namespace {

/**
 * Logging for the duration of one command
 */
class LoggingSession {
public:
  LoggingSession(LoggingSection section, bool verbose) {
    section.verbose = verbose;
    std::string error_msg;
    if (!::hoist::logging::init_logging(section, error_msg)) {
      // ConfigParser::validate has already resolved these settings
      std::cerr << "Error: " << error_msg << std::endl;
      ::hoist::logging::init_logging_default();
    }
  }

  ~LoggingSession() {
    ::hoist::logging::shutdown_logging();
  }

  LoggingSession(const LoggingSession&) = delete;
  LoggingSession& operator=(const LoggingSession&) = delete;
};

bool parse_int64(const std::string& text, int64_t& value) {
  try {
    size_t pos = 0;
    value = std::stoll(text, &pos);
    return pos == text.size();
  } catch (const std::logic_error&) {
    return false;
  }
}

}  // namespace

Commands::Commands()
    : verbose_(false) {}

Commands::~Commands() = default;

void Commands::set_store(std::shared_ptr<transfer::IObjectStore> store) {
  store_ = std::move(store);
  memory_store_.reset();
}

std::shared_ptr<transfer::IObjectStore> Commands::object_store() {
  if (store_) {
    return store_;
  }

  if (config_.store == "memory") {
    memory_store_ = std::make_shared<transfer::MemoryObjectStore>();
    store_ = memory_store_;
  } else {
    store_ = std::make_shared<transfer::S3ObjectStore>(config_.s3);
  }
  return store_;
}

void Commands::ensure_bucket(const std::string& bucket) {
  if (memory_store_ && !memory_store_->hasBucket(bucket)) {
    memory_store_->createBucket(bucket);
  }
}

std::unique_ptr<transfer::ResumeTokenStore> Commands::open_token_store() {
  fs::path db_path(config_.state.db_path);
  if (db_path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(db_path.parent_path(), ec);
    if (ec) {
      HOIST_LOG_WARN(
        "Failed to create state directory" << ::hoist::logging::kv(
          "path", db_path.parent_path().string()
        ) << ::hoist::logging::kv("error", ec.message())
      );
    }
  }
  return std::make_unique<transfer::ResumeTokenStore>(config_.state.db_path);
}

int Commands::report_result(
  const transfer::FileUpload& upload, const transfer::UploadResult& result
) {
  const auto& request = upload.request();
  if (result.success) {
    std::cout << "Uploaded " << request.source << " to s3://" << request.bucket << "/"
              << request.key << std::endl;
    std::cout << "  Size: " << format_size(result.bytes_transferred) << std::endl;
    std::cout << "  ETag: " << result.etag << std::endl;
    return 0;
  }

  std::cerr << "Error: Upload of " << request.source << " failed: " << result.error_code;
  if (!result.error_message.empty()) {
    std::cerr << " (" << result.error_message << ")";
  }
  std::cerr << std::endl;
  return 1;
}

int Commands::upload(
  const std::string& source, const std::string& bucket, const std::string& key,
  int64_t pause_after_ms, const std::string& id
) {
  auto store = object_store();
  ensure_bucket(bucket);

  // Open the token store first so a bad state path fails before any transfer
  std::unique_ptr<transfer::ResumeTokenStore> tokens;
  if (pause_after_ms >= 0) {
    tokens = open_token_store();
  }

  transfer::UploadFileRequest request;
  request.bucket = bucket;
  request.key = key;
  request.source = source;
  request.listeners.push_back(std::make_shared<transfer::LoggingTransferListener>());

  transfer::TransferManager manager(to_transfer_config(config_), store);
  auto handle = manager.uploadFile(request);

  if (pause_after_ms < 0) {
    return report_result(*handle, handle->wait());
  }

  auto finished = handle->waitFor(std::chrono::milliseconds(pause_after_ms));
  if (finished) {
    return report_result(*handle, *finished);
  }

  transfer::ResumableUpload token = handle->pause();
  if (handle->state() != transfer::TransferState::PAUSED) {
    // Finished between the wait and the pause
    return report_result(*handle, handle->wait());
  }

  const std::string token_id = id.empty() ? bucket + "/" + key : id;
  if (!tokens->save(token_id, token)) {
    std::cerr << "Error: Failed to save paused upload '" << token_id << "'" << std::endl;
    return 1;
  }

  std::cout << "Paused upload of " << source << " saved as '" << token_id << "'" << std::endl;
  std::cout << "  Transferred: " << format_size(token.transferredBytes()) << " of "
            << format_size(token.file_length) << std::endl;
  if (verbose_) {
    std::cout << "  Token: " << token.describe() << std::endl;
  }
  return 0;
}

int Commands::resume(const std::string& id) {
  auto tokens = open_token_store();
  auto record = tokens->get(id);
  if (!record) {
    std::cerr << "Error: No paused upload named '" << id << "'" << std::endl;
    return 1;
  }

  transfer::ResumableUpload token;
  try {
    token = record->token();
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: Saved token '" << id << "' is unreadable: " << e.what() << std::endl;
    return 1;
  }

  auto store = object_store();
  ensure_bucket(token.request.bucket);

  transfer::TransferManager manager(to_transfer_config(config_), store);
  std::vector<std::shared_ptr<transfer::TransferListener>> listeners{
    std::make_shared<transfer::LoggingTransferListener>()
  };
  auto handle = manager.resumeUploadFile(token, listeners);
  auto result = handle->wait();

  int rc = report_result(*handle, result);
  if (rc == 0) {
    tokens->remove(id);
  } else {
    HOIST_LOG_INFO("Keeping paused upload for another attempt" << ::hoist::logging::kv("id", id));
  }
  return rc;
}

int Commands::list() {
  auto tokens = open_token_store();
  auto records = tokens->list();

  if (records.empty()) {
    std::cout << "No paused uploads" << std::endl;
    return 0;
  }

  std::cout << "Paused uploads: " << records.size() << std::endl;
  for (const auto& record : records) {
    std::cout << "  " << record.id << std::endl;
    std::cout << "    Source: " << record.source_path << std::endl;
    std::cout << "    Destination: s3://" << record.bucket << "/" << record.object_key
              << std::endl;
    if (!record.multipart_upload_id.empty()) {
      std::cout << "    Upload ID: " << record.multipart_upload_id << std::endl;
    }
    std::cout << "    Paused: " << record.updated_at << std::endl;
    if (verbose_) {
      try {
        std::cout << "    Token: " << record.token().describe() << std::endl;
      } catch (const std::invalid_argument& e) {
        std::cout << "    Token: unreadable (" << e.what() << ")" << std::endl;
      }
    }
  }
  return 0;
}

int Commands::abort(const std::string& id) {
  auto tokens = open_token_store();
  auto record = tokens->get(id);
  if (!record) {
    std::cerr << "Error: No paused upload named '" << id << "'" << std::endl;
    return 1;
  }

  if (!record->multipart_upload_id.empty()) {
    auto store = object_store();
    transfer::ObjectKey object{record->bucket, record->object_key};
    auto status = store->abortMultipartUpload(object, record->multipart_upload_id);
    if (!status.success && !status.error.is(transfer::error_codes::kNoSuchUpload)) {
      std::cerr << "Error: Failed to abort multipart upload " << record->multipart_upload_id
                << ": " << status.error.code << " (" << status.error.message << ")"
                << std::endl;
      return 1;
    }
  }

  tokens->remove(id);
  std::cout << "Aborted paused upload '" << id << "'" << std::endl;
  return 0;
}

int Commands::execute(int argc, char* argv[]) {
  std::string command;

  if (argc > 1) {
    command = argv[1];
  }

  if (command.empty() || command == "help" || command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }

  // Parse flags
  std::vector<std::string> positional;
  std::string config_path;
  std::string store;
  std::string db_path;
  std::string bucket;
  std::string key;
  std::string id;
  int64_t pause_after_ms = -1;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = (i + 1 < argc);

    if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else if (arg == "--config" || arg == "-c" || arg == "--store" || arg == "--db" ||
               arg == "--bucket" || arg == "--key" || arg == "--id" ||
               arg == "--pause-after-ms") {
      if (!has_value) {
        std::cerr << "Error: " << arg << " requires a value" << std::endl;
        return 1;
      }
      std::string value = argv[++i];
      if (arg == "--config" || arg == "-c") {
        config_path = value;
      } else if (arg == "--store") {
        store = value;
      } else if (arg == "--db") {
        db_path = value;
      } else if (arg == "--bucket") {
        bucket = value;
      } else if (arg == "--key") {
        key = value;
      } else if (arg == "--id") {
        id = value;
      } else if (!parse_int64(value, pause_after_ms) || pause_after_ms < 0) {
        std::cerr << "Error: Invalid --pause-after-ms value '" << value << "'" << std::endl;
        return 1;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown option '" << arg << "'" << std::endl;
      return 1;
    } else {
      positional.push_back(arg);
    }
  }

  if (!config_path.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(config_path, config_)) {
      std::cerr << "Error: " << parser.get_last_error() << std::endl;
      return 1;
    }
  }
  if (!store.empty()) {
    config_.store = store;
  }
  if (!db_path.empty()) {
    config_.state.db_path = db_path;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config_, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    return 1;
  }

  LoggingSession logging_session(config_.logging, verbose_);

  // Execute command
  if (command == "upload") {
    if (positional.size() != 1 || bucket.empty()) {
      std::cerr << "Error: upload requires <file> and --bucket" << std::endl;
      return 1;
    }
    const std::string& source = positional[0];
    if (key.empty()) {
      key = fs::path(source).filename().string();
    }
    return upload(source, bucket, key, pause_after_ms, id);
  } else if (command == "resume") {
    if (positional.size() != 1) {
      std::cerr << "Error: resume requires <id>" << std::endl;
      return 1;
    }
    return resume(positional[0]);
  } else if (command == "list") {
    return list();
  } else if (command == "abort") {
    if (positional.size() != 1) {
      std::cerr << "Error: abort requires <id>" << std::endl;
      return 1;
    }
    return abort(positional[0]);
  } else {
    std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }
}

std::string Commands::format_size(uint64_t size) {
  const char* units[] = {"B", "KB", "MB", "GB"};
  int unit_index = 0;

  while (size >= 1024 && unit_index < 3) {
    size /= 1024;
    unit_index++;
  }

  std::ostringstream oss;
  oss << size << " " << units[unit_index];

  return oss.str();
}

void Commands::print_usage() {
  std::cout << "Usage: hoist <command> [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  upload <file>   Upload a file (multipart above the threshold)" << std::endl;
  std::cout << "  resume <id>     Resume a paused upload" << std::endl;
  std::cout << "  list            List paused uploads" << std::endl;
  std::cout << "  abort <id>      Discard a paused upload and its uploaded parts" << std::endl;
  std::cout << "  help            Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config, -c <path>      YAML configuration file" << std::endl;
  std::cout << "  --store <s3|memory>      Object store backend" << std::endl;
  std::cout << "  --db <path>              Paused upload database" << std::endl;
  std::cout << "  --bucket <name>          Destination bucket (upload)" << std::endl;
  std::cout << "  --key <key>              Destination key (default: file name)" << std::endl;
  std::cout << "  --pause-after-ms <ms>    Pause the upload and save its token" << std::endl;
  std::cout << "  --id <id>                Name for the saved token (default: bucket/key)"
            << std::endl;
  std::cout << "  --verbose, -v            Verbose output" << std::endl;
}

}  // namespace cli
}  // namespace hoist
