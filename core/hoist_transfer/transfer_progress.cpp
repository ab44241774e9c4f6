// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_progress.hpp"

#define HOIST_LOG_COMPONENT "transfer_progress"
#include <hoist_log_macros.hpp>

namespace hoist {
namespace transfer {

using hoist::logging::kv;

void LoggingTransferListener::onTransferInitiated(const UploadFileRequest& request) {
  last_step_.store(0);
  HOIST_LOG_INFO("Transfer started" << kv("object", request.object().str())
                                    << kv("source", request.source));
}

void LoggingTransferListener::onBytesTransferred(
  const UploadFileRequest& request, const TransferProgressSnapshot& progress
) {
  auto ratio = progress.ratioTransferred();
  if (!ratio) {
    return;
  }

  int step = static_cast<int>(*ratio * 10.0);
  if (step > 10) {
    step = 10;
  }

  int previous = last_step_.load();
  while (step > previous) {
    if (last_step_.compare_exchange_weak(previous, step)) {
      HOIST_LOG_INFO("Transfer progress" << kv("object", request.object().str())
                                         << kv("percent", step * 10)
                                         << kv("bytes", progress.transferred_bytes)
                                         << kv("total", *progress.total_bytes));
      return;
    }
  }
}

void LoggingTransferListener::onTransferComplete(
  const UploadFileRequest& request, const TransferProgressSnapshot& progress
) {
  HOIST_LOG_INFO("Transfer complete" << kv("object", request.object().str())
                                     << kv("bytes", progress.transferred_bytes));
}

void LoggingTransferListener::onTransferFailed(
  const UploadFileRequest& request, const TransferProgressSnapshot& progress,
  const std::string& error_code, const std::string& error_message
) {
  HOIST_LOG_ERROR("Transfer failed" << kv("object", request.object().str())
                                    << kv("code", error_code) << kv("error", error_message)
                                    << kv("bytes", progress.transferred_bytes));
}

}  // namespace transfer
}  // namespace hoist
