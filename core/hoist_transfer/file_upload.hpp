// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_FILE_UPLOAD_HPP
#define HOIST_FILE_UPLOAD_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "resumable_upload.hpp"
#include "transfer_progress.hpp"
#include "transfer_state.hpp"
#include "upload_request.hpp"

namespace hoist {
namespace transfer {

// Failure codes raised by the transfer engine itself. Store failures carry the
// store's own code (e.g. NoSuchBucket).
namespace result_codes {
constexpr const char* kTransferPaused = "TransferPaused";
constexpr const char* kResumeCheckTimeout = "ResumeCheckTimeout";
constexpr const char* kInvalidResumeToken = "InvalidResumeToken";
constexpr const char* kFileNotFound = "FileNotFound";
constexpr const char* kFileReadError = "FileReadError";
constexpr const char* kTransferManagerClosed = "TransferManagerClosed";
}  // namespace result_codes

/**
 * Outcome of an upload
 */
struct UploadResult {
  bool success = false;
  std::string etag;
  uint64_t bytes_transferred = 0;
  std::string error_code;
  std::string error_message;

  static UploadResult Success(const std::string& etag, uint64_t bytes) {
    UploadResult result;
    result.success = true;
    result.etag = etag;
    result.bytes_transferred = bytes;
    return result;
  }

  static UploadResult Failure(const std::string& code, const std::string& message) {
    UploadResult result;
    result.success = false;
    result.error_code = code;
    result.error_message = message;
    return result;
  }

  bool paused() const {
    return !success && error_code == result_codes::kTransferPaused;
  }
};

class UploadOperation;

/**
 * Handle to an upload submitted to a TransferManager
 *
 * Destroying the handle does not cancel the transfer; background work keeps
 * its own reference to the shared state.
 *
 * Usage:
 *   auto upload = manager.uploadFile(request);
 *   ...
 *   ResumableUpload token = upload->pause();
 *   auto resumed = other_manager.resumeUploadFile(token);
 *   UploadResult result = resumed->wait();
 */
class FileUpload {
public:
  explicit FileUpload(std::shared_ptr<UploadOperation> operation);
  ~FileUpload();

  // Non-copyable, non-movable
  FileUpload(const FileUpload&) = delete;
  FileUpload& operator=(const FileUpload&) = delete;
  FileUpload(FileUpload&&) = delete;
  FileUpload& operator=(FileUpload&&) = delete;

  /**
   * Pause the transfer and return a token to resume it
   *
   * Non-blocking. The token holds the parts acknowledged so far; results that
   * arrive later are not added. Calling pause() again returns the same token.
   * Once CompleteMultipartUpload has been sent the transfer can no longer be
   * paused: pause() waits for that request and the transfer ends COMPLETED
   * or FAILED.
   * On a completed or failed transfer the state is left unchanged and the
   * token reflects the last recorded progress.
   */
  ResumableUpload pause();

  /**
   * Block until the transfer completes, fails or is paused
   *
   * A paused transfer yields a failure with code TransferPaused.
   */
  UploadResult wait();

  /**
   * Like wait(), bounded by @p timeout
   * @return nullopt if the transfer is still running
   */
  std::optional<UploadResult> waitFor(std::chrono::milliseconds timeout);

  TransferProgressSnapshot progress() const;

  TransferState state() const;

  const UploadFileRequest& request() const;

  const std::string& transferId() const;

private:
  std::shared_ptr<UploadOperation> operation_;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_FILE_UPLOAD_HPP
