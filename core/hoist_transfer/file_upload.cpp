// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_upload.hpp"

#include "upload_operation.hpp"

namespace hoist {
namespace transfer {

FileUpload::FileUpload(std::shared_ptr<UploadOperation> operation)
    : operation_(std::move(operation)) {}

FileUpload::~FileUpload() = default;

ResumableUpload FileUpload::pause() {
  return operation_->pause();
}

UploadResult FileUpload::wait() {
  return operation_->wait();
}

std::optional<UploadResult> FileUpload::waitFor(std::chrono::milliseconds timeout) {
  return operation_->waitFor(timeout);
}

TransferProgressSnapshot FileUpload::progress() const {
  return operation_->progressSnapshot();
}

TransferState FileUpload::state() const {
  return operation_->state();
}

const UploadFileRequest& FileUpload::request() const {
  return operation_->request();
}

const std::string& FileUpload::transferId() const {
  return operation_->transferId();
}

}  // namespace transfer
}  // namespace hoist
