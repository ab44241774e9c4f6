// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_TRANSFER_MANAGER_HPP
#define HOIST_TRANSFER_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "file_upload.hpp"
#include "object_store.hpp"
#include "resumable_upload.hpp"
#include "retry_handler.hpp"
#include "transfer_interfaces.hpp"
#include "upload_request.hpp"
#include "waiter.hpp"

namespace hoist {
namespace transfer {

/**
 * Configuration for a TransferManager
 */
struct TransferConfig {
  std::string name = "default";  // Used in transfer ids and log messages

  // Files of at least this size use multipart upload
  uint64_t multipart_threshold_bytes = 8ULL * 1024 * 1024;

  // Preferred part size; raised when the file would need more than 10000 parts
  uint64_t part_size_bytes = 8ULL * 1024 * 1024;

  // Worker threads shared by all transfers of this manager
  size_t max_concurrency = 4;

  // Abort the multipart upload when a transfer fails
  bool abort_on_failure = true;

  // Retries of individual store requests
  RetryConfig retry;

  // Existence check of a paused multipart upload on resume
  WaiterConfig resume_check;
};

/**
 * Uploads local files to an object store, with pause and resume
 *
 * Files of at least multipart_threshold_bytes are uploaded as multipart
 * uploads whose parts run in parallel on the manager's worker pool; smaller
 * files use a single PutObject.
 *
 * A paused transfer yields a ResumableUpload. Any manager, including one with
 * a different configuration or in another process, can resume it:
 * - Token without multipart state: the upload restarts
 * - Source file changed since the pause: the stale multipart upload is
 *   aborted and the upload restarts
 * - Otherwise the multipart upload is looked up with ListParts (bounded by
 *   resume_check). If it still exists only the missing parts are sent;
 *   if it is gone the upload restarts.
 *
 * Destroying the manager stops its workers. Transfers still running fail with
 * TransferManagerClosed.
 *
 * Usage:
 *   TransferManager manager(config, store);
 *   auto upload = manager.uploadFile(request);
 *   UploadResult result = upload->wait();
 */
class TransferManager {
public:
  /**
   * @throws std::invalid_argument if @p store is null
   */
  TransferManager(
    TransferConfig config, std::shared_ptr<IObjectStore> store,
    std::shared_ptr<IFileSystem> filesystem = nullptr,
    std::shared_ptr<WaiterClock> clock = nullptr
  );
  ~TransferManager();

  // Non-copyable, non-movable
  TransferManager(const TransferManager&) = delete;
  TransferManager& operator=(const TransferManager&) = delete;
  TransferManager(TransferManager&&) = delete;
  TransferManager& operator=(TransferManager&&) = delete;

  /**
   * Start uploading a file
   *
   * The source signature is captured and the handle is IN_PROGRESS when this
   * returns. A missing source yields a FAILED handle (FileNotFound).
   */
  std::unique_ptr<FileUpload> uploadFile(const UploadFileRequest& request);

  /**
   * Resume a paused upload
   *
   * The returned handle starts PAUSED and enters IN_PROGRESS once the resume
   * begins on a worker. An inconsistent token yields a FAILED handle
   * (InvalidResumeToken).
   *
   * @param listeners Listeners for the resumed transfer (tokens carry none)
   */
  std::unique_ptr<FileUpload> resumeUploadFile(
    const ResumableUpload& token,
    const std::vector<std::shared_ptr<TransferListener>>& listeners = {}
  );

  /**
   * Transfers currently IN_PROGRESS
   */
  size_t activeTransfers() const;

  const TransferConfig& config() const;

  /**
   * max(configured, ceil(file_length / 10000)), at least 1
   */
  static uint64_t computePartSize(uint64_t file_length, uint64_t configured_part_size);

  static uint32_t computePartCount(uint64_t file_length, uint64_t part_size);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_TRANSFER_MANAGER_HPP
