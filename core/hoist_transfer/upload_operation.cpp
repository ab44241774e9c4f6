// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_operation.hpp"

#include <exception>

#define HOIST_LOG_COMPONENT "file_upload"
#include <hoist_log_macros.hpp>

namespace hoist {
namespace transfer {

using hoist::logging::kv;

UploadOperation::UploadOperation(
  std::string transfer_id, UploadFileRequest request, FileSignature signature
)
    : transfer_id_(std::move(transfer_id))
    , request_(std::move(request))
    , state_machine_(TransferState::NOT_STARTED)
    , signature_(signature) {}

UploadOperation::UploadOperation(std::string transfer_id, const ResumableUpload& token)
    : transfer_id_(std::move(transfer_id))
    , request_(token.request)
    , state_machine_(TransferState::PAUSED) {
  signature_.size_bytes = token.file_length;
  signature_.last_modified_ns = token.file_last_modified_ns;

  if (token.hasMultipartState()) {
    upload_id_ = token.multipart_upload_id;
    part_size_ = *token.part_size_bytes;
    total_parts_ = *token.total_parts;
    for (const auto& part : *token.transferred_parts) {
      parts_[part.part_number] = part;
    }
  }
  pause_token_ = tokenLocked();
}

FileSignature UploadOperation::signature() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return signature_;
}

bool UploadOperation::start(std::string& error_msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (start_cancelled_) {
    error_msg = "Transfer was paused before it started";
    return false;
  }
  if (!state_machine_.transitionTo(TransferState::IN_PROGRESS, error_msg)) {
    return false;
  }
  pause_token_.reset();
  return true;
}

bool UploadOperation::isActive() const {
  return state_machine_.isState(TransferState::IN_PROGRESS);
}

TransferState UploadOperation::state() const {
  return state_machine_.state();
}

ResumableUpload UploadOperation::pause() {
  ResumableUpload token;
  TransferState from;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (completing_) {
      // The object may already exist; report the outcome of the completion
      cv_.wait(lock, [this] {
        return result_.has_value();
      });
      return tokenLocked();
    }

    from = state_machine_.state();
    if (isTerminal(from)) {
      return tokenLocked();
    }

    if (from == TransferState::PAUSED) {
      // Either already paused, or a resumed handle whose resume has not begun
      start_cancelled_ = true;
      if (!pause_token_) {
        pause_token_ = tokenLocked();
      }
      if (!result_) {
        finishLocked(UploadResult::Failure(result_codes::kTransferPaused, "Transfer paused"));
      }
      return *pause_token_;
    }

    std::string error_msg;
    if (!state_machine_.transitionTo(TransferState::PAUSED, error_msg)) {
      // LCOV_EXCL_START - every non-terminal state can pause
      HOIST_LOG_WARN("Pause rejected" << kv("transfer_id", transfer_id_)
                                      << kv("error", error_msg));
      return tokenLocked();
      // LCOV_EXCL_STOP
    }
    pause_token_ = tokenLocked();
    token = *pause_token_;
    finishLocked(UploadResult::Failure(result_codes::kTransferPaused, "Transfer paused"));
  }

  HOIST_LOG_INFO("Transfer paused" << kv("transfer_id", transfer_id_)
                                   << kv("from", transferStateToString(from))
                                   << kv("token", token.describe()));
  return token;
}

bool UploadOperation::resetForRestart(const FileSignature& signature) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_machine_.isState(TransferState::IN_PROGRESS)) {
    return false;
  }
  signature_ = signature;
  upload_id_.reset();
  part_size_ = 0;
  total_parts_ = 0;
  parts_.clear();
  return true;
}

bool UploadOperation::recordMultipartUpload(
  const std::string& upload_id, uint64_t part_size, uint32_t total_parts,
  const std::vector<CompletedPart>& existing
) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_machine_.isState(TransferState::IN_PROGRESS)) {
    return false;
  }

  upload_id_ = upload_id;
  part_size_ = part_size;
  total_parts_ = total_parts;
  parts_.clear();

  uint64_t existing_bytes = 0;
  for (const auto& part : existing) {
    if (part.part_number < 1 || static_cast<uint32_t>(part.part_number) > total_parts) {
      continue;
    }
    parts_[part.part_number] = part;
    existing_bytes += part.size_bytes;
  }
  progress_.addTransferredBytes(existing_bytes);
  return true;
}

UploadOperation::PartOutcome UploadOperation::recordPart(const CompletedPart& part) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_machine_.isState(TransferState::IN_PROGRESS)) {
    return PartOutcome::DROPPED;
  }

  if (!parts_.emplace(part.part_number, part).second) {
    return PartOutcome::RECORDED;
  }
  progress_.addTransferredBytes(part.size_bytes);
  return parts_.size() == total_parts_ ? PartOutcome::RECORDED_LAST : PartOutcome::RECORDED;
}

std::vector<CompletedPart> UploadOperation::completedParts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CompletedPart> parts;
  parts.reserve(parts_.size());
  for (const auto& entry : parts_) {
    parts.push_back(entry.second);
  }
  return parts;
}

std::optional<std::string> UploadOperation::multipartUploadId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return upload_id_;
}

bool UploadOperation::beginCompleting() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_machine_.isState(TransferState::IN_PROGRESS)) {
    return false;
  }
  completing_ = true;
  return true;
}

bool UploadOperation::complete(const std::string& etag) {
  UploadResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string error_msg;
    if (!state_machine_.transition(
          TransferState::IN_PROGRESS, TransferState::COMPLETED, error_msg
        )) {
      return false;
    }
    result = UploadResult::Success(etag, progress_.transferredBytes());
    finishLocked(result);
  }
  notifyFinished(result);
  return true;
}

bool UploadOperation::fail(const std::string& code, const std::string& message) {
  UploadResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string error_msg;
    if (!state_machine_.transitionTo(TransferState::FAILED, error_msg)) {
      return false;
    }
    result = UploadResult::Failure(code, message);
    result.bytes_transferred = progress_.transferredBytes();
    finishLocked(result);
  }
  notifyFinished(result);
  return true;
}

void UploadOperation::close(const std::string& code, const std::string& message) {
  UploadResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completing_) {
      return;
    }

    std::string error_msg;
    if (!state_machine_.transitionTo(TransferState::FAILED, error_msg)) {
      if (!result_) {
        start_cancelled_ = true;
        finishLocked(UploadResult::Failure(code, message));
      }
      return;
    }
    result = UploadResult::Failure(code, message);
    result.bytes_transferred = progress_.transferredBytes();
    finishLocked(result);
  }
  notifyFinished(result);
}

UploadResult UploadOperation::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] {
    return result_.has_value();
  });
  return *result_;
}

std::optional<UploadResult> UploadOperation::waitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] {
        return result_.has_value();
      })) {
    return std::nullopt;
  }
  return *result_;
}

ResumableUpload UploadOperation::tokenLocked() const {
  ResumableUpload token;
  token.request = request_;
  token.request.listeners.clear();
  token.file_length = signature_.size_bytes;
  token.file_last_modified_ns = signature_.last_modified_ns;

  if (upload_id_) {
    token.multipart_upload_id = upload_id_;
    token.part_size_bytes = part_size_;
    token.total_parts = total_parts_;
    std::vector<CompletedPart> parts;
    parts.reserve(parts_.size());
    for (const auto& entry : parts_) {
      parts.push_back(entry.second);
    }
    token.transferred_parts = std::move(parts);
  }
  return token;
}

void UploadOperation::finishLocked(UploadResult result) {
  completing_ = false;
  result_ = std::move(result);
  cv_.notify_all();
}

void UploadOperation::notifyInitiated() {
  for (const auto& listener : request_.listeners) {
    try {
      listener->onTransferInitiated(request_);
    } catch (const std::exception& e) {
      HOIST_LOG_WARN("Listener threw" << kv("transfer_id", transfer_id_) << kv("error", e.what()));
    }
  }
}

void UploadOperation::notifyBytesTransferred() {
  if (request_.listeners.empty()) {
    return;
  }
  auto snapshot = progress_.snapshot();
  for (const auto& listener : request_.listeners) {
    try {
      listener->onBytesTransferred(request_, snapshot);
    } catch (const std::exception& e) {
      HOIST_LOG_WARN("Listener threw" << kv("transfer_id", transfer_id_) << kv("error", e.what()));
    }
  }
}

void UploadOperation::notifyFinished(const UploadResult& result) {
  auto snapshot = progress_.snapshot();
  for (const auto& listener : request_.listeners) {
    try {
      if (result.success) {
        listener->onTransferComplete(request_, snapshot);
      } else {
        listener->onTransferFailed(request_, snapshot, result.error_code, result.error_message);
      }
    } catch (const std::exception& e) {
      HOIST_LOG_WARN("Listener threw" << kv("transfer_id", transfer_id_) << kv("error", e.what()));
    }
  }
}

}  // namespace transfer
}  // namespace hoist
