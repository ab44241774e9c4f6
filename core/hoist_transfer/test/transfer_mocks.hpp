// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_TRANSFER_MOCKS_HPP
#define HOIST_TRANSFER_MOCKS_HPP

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "object_store.hpp"
#include "transfer_interfaces.hpp"
#include "transfer_progress.hpp"
#include "waiter.hpp"

namespace hoist {
namespace transfer {
namespace test {

/**
 * Mock implementation of IFileSystem for testing
 */
class MockFileSystem : public IFileSystem {
public:
  MOCK_METHOD(bool, exists, (const std::string& path), (const, override));
  MOCK_METHOD(std::optional<uint64_t>, file_size, (const std::string& path), (const, override));
  MOCK_METHOD(
    std::optional<int64_t>, last_write_time_ns, (const std::string& path), (const, override)
  );
  MOCK_METHOD(
    bool, read_range,
    (const std::string& path, uint64_t offset, uint64_t length, std::string& out),
    (const, override)
  );
};

/**
 * Mock implementation of IObjectStore for testing
 */
class MockObjectStore : public IObjectStore {
public:
  MOCK_METHOD(
    StoreResult<std::string>, putObject,
    (const ObjectKey& object, const std::string& body, const ObjectAttributes& attributes),
    (override)
  );
  MOCK_METHOD(
    StoreResult<std::string>, createMultipartUpload,
    (const ObjectKey& object, const ObjectAttributes& attributes), (override)
  );
  MOCK_METHOD(
    StoreResult<std::string>, uploadPart,
    (const ObjectKey& object, const std::string& upload_id, int part_number,
     const std::string& body),
    (override)
  );
  MOCK_METHOD(
    StoreResult<std::string>, completeMultipartUpload,
    (const ObjectKey& object, const std::string& upload_id,
     const std::vector<CompletedPart>& parts),
    (override)
  );
  MOCK_METHOD(
    StoreStatus, abortMultipartUpload, (const ObjectKey& object, const std::string& upload_id),
    (override)
  );
  MOCK_METHOD(
    StoreResult<std::vector<CompletedPart>>, listParts,
    (const ObjectKey& object, const std::string& upload_id), (override)
  );
  MOCK_METHOD(
    StoreResult<std::vector<MultipartUploadSummary>>, listMultipartUploads,
    (const std::string& bucket, const std::string& prefix), (override)
  );
  MOCK_METHOD(StoreResult<ObjectInfo>, headObject, (const ObjectKey& object), (override));
};

/**
 * Waiter clock that advances only when slept on
 */
class FakeWaiterClock : public WaiterClock {
public:
  std::chrono::steady_clock::time_point now() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }

  void sleepFor(std::chrono::milliseconds duration) override {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += duration;
    sleeps_.push_back(duration);
  }

  void advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += duration;
  }

  std::vector<std::chrono::milliseconds> sleeps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sleeps_;
  }

private:
  mutable std::mutex mutex_;
  std::chrono::steady_clock::time_point now_{};
  std::vector<std::chrono::milliseconds> sleeps_;
};

/**
 * Listener that records every event
 */
class RecordingListener : public TransferListener {
public:
  void onTransferInitiated(const UploadFileRequest& /*request*/) override {
    ++initiated;
  }

  void onBytesTransferred(
    const UploadFileRequest& /*request*/, const TransferProgressSnapshot& progress
  ) override {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_bytes.push_back(progress.transferred_bytes);
  }

  void onTransferComplete(
    const UploadFileRequest& /*request*/, const TransferProgressSnapshot& progress
  ) override {
    final_bytes = progress.transferred_bytes;
    ++completed;
  }

  void onTransferFailed(
    const UploadFileRequest& /*request*/, const TransferProgressSnapshot& /*progress*/,
    const std::string& error_code, const std::string& /*error_message*/
  ) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_error_code_ = error_code;
    }
    ++failed;
  }

  std::vector<uint64_t> progressBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_bytes;
  }

  std::string lastErrorCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_code_;
  }

  std::atomic<int> initiated{0};
  std::atomic<int> completed{0};
  std::atomic<int> failed{0};
  std::atomic<uint64_t> final_bytes{0};

private:
  mutable std::mutex mutex_;
  std::vector<uint64_t> progress_bytes;
  std::string last_error_code_;
};

}  // namespace test
}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_TRANSFER_MOCKS_HPP
