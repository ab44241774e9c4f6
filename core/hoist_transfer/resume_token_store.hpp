// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_RESUME_TOKEN_STORE_HPP
#define HOIST_RESUME_TOKEN_STORE_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "resumable_upload.hpp"

namespace hoist {
namespace transfer {

/**
 * A paused upload saved in the token store
 */
struct PausedUploadRecord {
  std::string id;                   // Primary key chosen by the caller
  std::string bucket;
  std::string object_key;
  std::string source_path;
  std::string multipart_upload_id;  // Empty when the token has no multipart state
  std::string token_json;           // ResumableUpload::toJson()
  std::string created_at;           // ISO 8601 timestamp
  std::string updated_at;           // ISO 8601 timestamp

  /**
   * Parse the stored token
   * @throws std::invalid_argument if the stored JSON is not a valid token
   */
  ResumableUpload token() const {
    return ResumableUpload::fromJson(token_json);
  }
};

/**
 * SQLite store of paused upload tokens
 *
 * Lets a later run (or another process) resume an upload paused earlier.
 * Uses WAL mode for crash safety.
 *
 * Thread-safety: All methods are thread-safe (protected by mutex).
 */
class ResumeTokenStore {
public:
  /**
   * Open or create the database at @p db_path
   *
   * @throws std::runtime_error if database cannot be opened
   */
  explicit ResumeTokenStore(const std::string& db_path);
  ~ResumeTokenStore();

  // Non-copyable, non-movable
  ResumeTokenStore(const ResumeTokenStore&) = delete;
  ResumeTokenStore& operator=(const ResumeTokenStore&) = delete;
  ResumeTokenStore(ResumeTokenStore&&) = delete;
  ResumeTokenStore& operator=(ResumeTokenStore&&) = delete;

  /**
   * Insert or replace the token saved under @p id
   *
   * created_at is kept when replacing.
   *
   * @return true on success
   */
  bool save(const std::string& id, const ResumableUpload& token);

  std::optional<PausedUploadRecord> get(const std::string& id);

  /**
   * @return true if removed, false if not found
   */
  bool remove(const std::string& id);

  /**
   * All saved tokens, oldest first
   */
  std::vector<PausedUploadRecord> list();

  size_t count();

  /**
   * Delete tokens not updated within @p age
   * @return Number of tokens deleted
   */
  int deleteOlderThan(std::chrono::hours age);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_RESUME_TOKEN_STORE_HPP
