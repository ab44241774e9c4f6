// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_CLI_COMMANDS_HPP
#define HOIST_CLI_COMMANDS_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "config_parser.hpp"
#include "file_upload.hpp"
#include "memory_object_store.hpp"
#include "object_store.hpp"

namespace hoist {
namespace transfer {
class ResumeTokenStore;
}
}  // namespace hoist

namespace hoist {
namespace cli {

/**
 * Command handler for the hoist CLI
 *
 * Paused uploads are saved in the SQLite token store at state.db_path under
 * an id chosen by the user (default "<bucket>/<key>"), so a later run can
 * resume or abort them.
 */
class Commands {
public:
  Commands();
  ~Commands();

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

  /**
   * Use @p store instead of the one selected by the configuration
   */
  void set_store(std::shared_ptr<transfer::IObjectStore> store);

  /**
   * Execute upload command
   *
   * @param pause_after_ms Pause the upload after this many milliseconds and
   *        save its token under @p id; negative uploads to completion
   */
  int upload(
    const std::string& source, const std::string& bucket, const std::string& key,
    int64_t pause_after_ms, const std::string& id
  );

  /**
   * Execute resume command
   */
  int resume(const std::string& id);

  /**
   * Execute list command
   */
  int list();

  /**
   * Execute abort command
   */
  int abort(const std::string& id);

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

  HoistConfig& config() {
    return config_;
  }

private:
  HoistConfig config_;
  bool verbose_;
  std::shared_ptr<transfer::IObjectStore> store_;
  std::shared_ptr<transfer::MemoryObjectStore> memory_store_;  // Set when store is "memory"

  /**
   * Object store selected by the configuration (created on first use)
   */
  std::shared_ptr<transfer::IObjectStore> object_store();

  /**
   * Create the bucket when running against the in-process store
   */
  void ensure_bucket(const std::string& bucket);

  std::unique_ptr<transfer::ResumeTokenStore> open_token_store();

  int report_result(const transfer::FileUpload& upload, const transfer::UploadResult& result);

  /**
   * Print usage message
   */
  void print_usage();

  /**
   * Format size for human readable output
   */
  std::string format_size(uint64_t size);
};

}  // namespace cli
}  // namespace hoist

#endif  // HOIST_CLI_COMMANDS_HPP
