// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "resume_token_store.hpp"

#include <sqlite3.h>

#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

#define HOIST_LOG_COMPONENT "resume_token_store"
#include <hoist_log_macros.hpp>

namespace hoist {
namespace transfer {

using hoist::logging::kv;

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point point) {
  auto time = std::chrono::system_clock::to_time_t(point);
  std::tm tm{};
  gmtime_r(&time, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

std::string currentTimestamp() {
  return formatTimestamp(std::chrono::system_clock::now());
}

std::string columnText(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  return text ? reinterpret_cast<const char*>(text) : "";
}

}  // namespace

class ResumeTokenStore::Impl {
public:
  sqlite3* db = nullptr;
  std::string db_path;
  mutable std::mutex mutex;

  ~Impl() {
    if (db) {
      sqlite3_close(db);
    }
  }

  void initDatabase() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
      throw std::runtime_error("Cannot open SQLite database: " + db_path);  // LCOV_EXCL_BR_LINE
    }

    char* err_msg = nullptr;
    rc = sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      std::string error = err_msg ? err_msg : "Unknown error";
      sqlite3_free(err_msg);
      throw std::runtime_error("Failed to enable WAL mode: " + error);  // LCOV_EXCL_BR_LINE
    }

    rc = sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      HOIST_LOG_WARN("PRAGMA synchronous failed" << kv("error", err_msg ? err_msg : "unknown"));
      sqlite3_free(err_msg);
    }

    rc = sqlite3_exec(db, "PRAGMA busy_timeout=5000;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      HOIST_LOG_WARN("PRAGMA busy_timeout failed" << kv("error", err_msg ? err_msg : "unknown"));
      sqlite3_free(err_msg);
    }

    const char* create_sql = R"(
      CREATE TABLE IF NOT EXISTS paused_uploads (
        id TEXT PRIMARY KEY,
        bucket TEXT NOT NULL,
        object_key TEXT NOT NULL,
        source_path TEXT NOT NULL,
        multipart_upload_id TEXT,
        token_json TEXT NOT NULL,
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL
      );
      CREATE INDEX IF NOT EXISTS idx_paused_updated_at ON paused_uploads(updated_at);
    )";

    rc = sqlite3_exec(db, create_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
      std::string error = err_msg ? err_msg : "Unknown error";
      sqlite3_free(err_msg);
      throw std::runtime_error("Failed to create tables: " + error);  // LCOV_EXCL_BR_LINE
    }
  }

  static PausedUploadRecord parseRecord(sqlite3_stmt* stmt) {
    PausedUploadRecord record;
    record.id = columnText(stmt, 0);
    record.bucket = columnText(stmt, 1);
    record.object_key = columnText(stmt, 2);
    record.source_path = columnText(stmt, 3);
    record.multipart_upload_id = columnText(stmt, 4);
    record.token_json = columnText(stmt, 5);
    record.created_at = columnText(stmt, 6);
    record.updated_at = columnText(stmt, 7);
    return record;
  }
};

ResumeTokenStore::ResumeTokenStore(const std::string& db_path)
    : impl_(std::make_unique<Impl>())  // LCOV_EXCL_BR_LINE
{
  impl_->db_path = db_path;
  impl_->initDatabase();
}

ResumeTokenStore::~ResumeTokenStore() = default;

bool ResumeTokenStore::save(const std::string& id, const ResumableUpload& token) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = R"(
    INSERT INTO paused_uploads
    (id, bucket, object_key, source_path, multipart_upload_id, token_json, created_at, updated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      bucket = excluded.bucket,
      object_key = excluded.object_key,
      source_path = excluded.source_path,
      multipart_upload_id = excluded.multipart_upload_id,
      token_json = excluded.token_json,
      updated_at = excluded.updated_at
  )";

  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    HOIST_LOG_ERROR("Prepare failed" << kv("error", sqlite3_errmsg(impl_->db)));
    return false;
  }

  std::string now = currentTimestamp();
  std::string json = token.toJson();
  std::string upload_id = token.multipart_upload_id.value_or("");

  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, token.request.bucket.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, token.request.key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, token.request.source.c_str(), -1, SQLITE_TRANSIENT);
  if (upload_id.empty()) {
    sqlite3_bind_null(stmt, 5);
  } else {
    sqlite3_bind_text(stmt, 5, upload_id.c_str(), -1, SQLITE_TRANSIENT);
  }
  sqlite3_bind_text(stmt, 6, json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, now.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, now.c_str(), -1, SQLITE_TRANSIENT);

  rc = sqlite3_step(stmt);
  if (rc != SQLITE_DONE) {
    HOIST_LOG_ERROR("Saving token failed" << kv("id", id)
                                          << kv("error", sqlite3_errmsg(impl_->db)));
  }
  sqlite3_finalize(stmt);

  return rc == SQLITE_DONE;
}

std::optional<PausedUploadRecord> ResumeTokenStore::get(const std::string& id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = R"(
    SELECT id, bucket, object_key, source_path, multipart_upload_id, token_json,
           created_at, updated_at
    FROM paused_uploads WHERE id = ?
  )";

  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

  rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    PausedUploadRecord record = Impl::parseRecord(stmt);
    sqlite3_finalize(stmt);
    return record;
  }

  sqlite3_finalize(stmt);
  return std::nullopt;
}

bool ResumeTokenStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = "DELETE FROM paused_uploads WHERE id = ?";

  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return false;
  }

  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

  rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);

  return rc == SQLITE_DONE && sqlite3_changes(impl_->db) > 0;
}

std::vector<PausedUploadRecord> ResumeTokenStore::list() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = R"(
    SELECT id, bucket, object_key, source_path, multipart_upload_id, token_json,
           created_at, updated_at
    FROM paused_uploads ORDER BY created_at, id
  )";

  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return {};
  }

  std::vector<PausedUploadRecord> records;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    records.push_back(Impl::parseRecord(stmt));
  }

  sqlite3_finalize(stmt);
  return records;
}

size_t ResumeTokenStore::count() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = "SELECT COUNT(*) FROM paused_uploads";

  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return 0;
  }

  rc = sqlite3_step(stmt);
  size_t count = 0;
  if (rc == SQLITE_ROW) {
    count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
  }

  sqlite3_finalize(stmt);
  return count;
}

int ResumeTokenStore::deleteOlderThan(std::chrono::hours age) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::string cutoff = formatTimestamp(std::chrono::system_clock::now() - age);

  const char* sql = "DELETE FROM paused_uploads WHERE updated_at < ?";

  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return 0;
  }

  sqlite3_bind_text(stmt, 1, cutoff.c_str(), -1, SQLITE_TRANSIENT);

  rc = sqlite3_step(stmt);
  int deleted = rc == SQLITE_DONE ? sqlite3_changes(impl_->db) : 0;
  sqlite3_finalize(stmt);

  if (deleted > 0) {
    HOIST_LOG_INFO("Expired paused uploads removed" << kv("count", deleted));
  }
  return deleted;
}

}  // namespace transfer
}  // namespace hoist
