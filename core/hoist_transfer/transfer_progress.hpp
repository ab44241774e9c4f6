// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_TRANSFER_PROGRESS_HPP
#define HOIST_TRANSFER_PROGRESS_HPP

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "upload_request.hpp"

namespace hoist {
namespace transfer {

/**
 * Point-in-time view of a transfer's progress
 */
struct TransferProgressSnapshot {
  uint64_t transferred_bytes = 0;
  std::optional<uint64_t> total_bytes;  // Unknown until the upload strategy is decided

  /**
   * @return transferred / total, or nullopt while the total is unknown or zero
   */
  std::optional<double> ratioTransferred() const {
    if (!total_bytes || *total_bytes == 0) {
      return std::nullopt;
    }
    return static_cast<double>(transferred_bytes) / static_cast<double>(*total_bytes);
  }

  std::optional<uint64_t> remainingBytes() const {
    if (!total_bytes) {
      return std::nullopt;
    }
    return transferred_bytes >= *total_bytes ? 0 : *total_bytes - transferred_bytes;
  }
};

/**
 * Live progress counters of one transfer
 *
 * Lock-free; updated by part workers and read by any thread.
 */
class TransferProgress {
public:
  void setTotalBytes(uint64_t total) {
    total_bytes_.store(total);
    total_known_.store(true);
  }

  void addTransferredBytes(uint64_t bytes) {
    transferred_bytes_.fetch_add(bytes);
  }

  uint64_t transferredBytes() const {
    return transferred_bytes_.load();
  }

  TransferProgressSnapshot snapshot() const {
    TransferProgressSnapshot snap;
    snap.transferred_bytes = transferred_bytes_.load();
    if (total_known_.load()) {
      snap.total_bytes = total_bytes_.load();
    }
    return snap;
  }

private:
  std::atomic<uint64_t> transferred_bytes_{0};
  std::atomic<uint64_t> total_bytes_{0};
  std::atomic<bool> total_known_{false};
};

/**
 * Observer of transfer events
 *
 * Callbacks run on transfer worker threads, outside any handle lock. They must
 * not block for long.
 */
class TransferListener {
public:
  virtual ~TransferListener() = default;

  virtual void onTransferInitiated(const UploadFileRequest& /*request*/) {}

  virtual void onBytesTransferred(
    const UploadFileRequest& /*request*/, const TransferProgressSnapshot& /*progress*/
  ) {}

  virtual void onTransferComplete(
    const UploadFileRequest& /*request*/, const TransferProgressSnapshot& /*progress*/
  ) {}

  virtual void onTransferFailed(
    const UploadFileRequest& /*request*/, const TransferProgressSnapshot& /*progress*/,
    const std::string& /*error_code*/, const std::string& /*error_message*/
  ) {}
};

/**
 * Listener that writes transfer events to the hoist log
 *
 * Progress is logged when it crosses each 10% step.
 */
class LoggingTransferListener : public TransferListener {
public:
  void onTransferInitiated(const UploadFileRequest& request) override;

  void onBytesTransferred(
    const UploadFileRequest& request, const TransferProgressSnapshot& progress
  ) override;

  void onTransferComplete(
    const UploadFileRequest& request, const TransferProgressSnapshot& progress
  ) override;

  void onTransferFailed(
    const UploadFileRequest& request, const TransferProgressSnapshot& progress,
    const std::string& error_code, const std::string& error_message
  ) override;

  // Highest 10% step logged so far (0-10)
  int lastLoggedStep() const {
    return last_step_.load();
  }

private:
  std::atomic<int> last_step_{0};
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_TRANSFER_PROGRESS_HPP
