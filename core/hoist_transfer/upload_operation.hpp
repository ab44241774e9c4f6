// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_UPLOAD_OPERATION_HPP
#define HOIST_UPLOAD_OPERATION_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "file_signature.hpp"
#include "file_upload.hpp"
#include "resumable_upload.hpp"
#include "transfer_progress.hpp"
#include "transfer_state.hpp"
#include "upload_request.hpp"

namespace hoist {
namespace transfer {

/**
 * Shared state of one upload
 *
 * Owned jointly by the FileUpload handle and the manager's tasks. One mutex
 * guards the state transition, the multipart bookkeeping and the result, so
 * pause() always observes a consistent set of acknowledged parts.
 *
 * Listener callbacks are invoked outside the lock.
 */
class UploadOperation {
public:
  enum class PartOutcome {
    RECORDED,       // Part added, more outstanding
    RECORDED_LAST,  // Part added, every part acknowledged
    DROPPED,        // Transfer no longer in progress
  };

  /**
   * New upload, starts NOT_STARTED
   */
  UploadOperation(std::string transfer_id, UploadFileRequest request, FileSignature signature);

  /**
   * Upload resumed from @p token, starts PAUSED with the token's state
   */
  UploadOperation(std::string transfer_id, const ResumableUpload& token);

  UploadOperation(const UploadOperation&) = delete;
  UploadOperation& operator=(const UploadOperation&) = delete;

  const std::string& transferId() const {
    return transfer_id_;
  }

  const UploadFileRequest& request() const {
    return request_;
  }

  FileSignature signature() const;

  /**
   * Enter IN_PROGRESS
   *
   * Fails if the handle was paused before a resume could begin, or has
   * already finished.
   */
  bool start(std::string& error_msg);

  bool isActive() const;

  TransferState state() const;

  ResumableUpload pause();

  /**
   * Drop any multipart state and record a fresh source signature
   * @return false if no longer in progress
   */
  bool resetForRestart(const FileSignature& signature);

  /**
   * Record the multipart upload backing this transfer
   *
   * @param existing Parts already stored remotely (resume path)
   * @return false if no longer in progress
   */
  bool recordMultipartUpload(
    const std::string& upload_id, uint64_t part_size, uint32_t total_parts,
    const std::vector<CompletedPart>& existing
  );

  PartOutcome recordPart(const CompletedPart& part);

  // Parts acknowledged so far, ascending by part number
  std::vector<CompletedPart> completedParts() const;

  std::optional<std::string> multipartUploadId() const;

  /**
   * Mark CompleteMultipartUpload as sent
   *
   * From here on pause() waits for the outcome instead of pausing, and
   * close() leaves the result to the completing worker.
   *
   * @return false if no longer in progress
   */
  bool beginCompleting();

  /**
   * Finish successfully
   * @return false if the transfer was paused or already finished
   */
  bool complete(const std::string& etag);

  /**
   * Finish with an error
   * @return false if the transfer was paused or already finished
   */
  bool fail(const std::string& code, const std::string& message);

  /**
   * Release waiters of a transfer that will never run again (manager shutdown)
   *
   * Running transfers fail; a resumed handle still waiting to start keeps its
   * state but its wait() returns the given error.
   */
  void close(const std::string& code, const std::string& message);

  UploadResult wait();
  std::optional<UploadResult> waitFor(std::chrono::milliseconds timeout);

  TransferProgress& progress() {
    return progress_;
  }

  TransferProgressSnapshot progressSnapshot() const {
    return progress_.snapshot();
  }

  void notifyInitiated();
  void notifyBytesTransferred();

private:
  ResumableUpload tokenLocked() const;
  void finishLocked(UploadResult result);
  void notifyFinished(const UploadResult& result);

  const std::string transfer_id_;
  UploadFileRequest request_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  TransferStateMachine state_machine_;

  FileSignature signature_;
  std::optional<std::string> upload_id_;
  uint64_t part_size_ = 0;
  uint32_t total_parts_ = 0;
  std::map<int, CompletedPart> parts_;

  std::optional<ResumableUpload> pause_token_;
  bool start_cancelled_ = false;
  bool completing_ = false;
  std::optional<UploadResult> result_;

  TransferProgress progress_;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_UPLOAD_OPERATION_HPP
