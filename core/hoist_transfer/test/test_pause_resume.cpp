// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Pause and resume across transfer managers
 *
 * Every scenario runs for each pairing of two manager configurations: the
 * first manager starts and pauses the upload, the second resumes it from the
 * token. The store enforces the S3 minimum part size.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "memory_object_store.hpp"
#include "test_helpers.hpp"
#include "transfer_manager.hpp"

using namespace hoist::transfer;
using namespace hoist::transfer::test;

namespace {

constexpr uint64_t kFileSize = 24 * kMiB;
constexpr uint64_t kMinPartSize = 5 * kMiB;

TransferConfig managerConfig(const std::string& name, uint64_t threshold, uint64_t part_size) {
  TransferConfig config;
  config.name = name;
  config.multipart_threshold_bytes = threshold;
  config.part_size_bytes = part_size;
  config.max_concurrency = 4;
  config.retry.initial_delay = std::chrono::milliseconds(1);
  config.retry.max_delay = std::chrono::milliseconds(5);
  config.retry.jitter = false;
  return config;
}

TransferConfig configA() {
  return managerConfig("a", 8 * kMiB, 8 * kMiB);
}

TransferConfig configB() {
  return managerConfig("b", 5 * kMiB, 5 * kMiB);
}

struct ManagerPair {
  std::string name;
  TransferConfig first;
  TransferConfig second;
};

}  // namespace

class PauseResumeTest : public ::testing::TestWithParam<ManagerPair> {
protected:
  void SetUp() override {
    dir_ = createTempDir("hoist_pause_resume_");
    store_ = std::make_shared<MemoryObjectStore>(kMinPartSize);
    store_->createBucket("bucket");

    request_.bucket = "bucket";
    request_.key = "data/large.bin";
    request_.source = generateTestFile(dir_ + "/large.bin", kFileSize);

    first_ = std::make_unique<TransferManager>(GetParam().first, store_);
    second_ = std::make_unique<TransferManager>(GetParam().second, store_);
  }

  void TearDown() override {
    store_->clearInterceptor();
    first_.reset();
    second_.reset();
    cleanupTempDir(dir_);
  }

  uint64_t partsOf(const TransferConfig& config, uint64_t length) const {
    uint64_t part_size = TransferManager::computePartSize(length, config.part_size_bytes);
    return TransferManager::computePartCount(length, part_size);
  }

  /**
   * Start an upload on the first manager and pause it once part 1 is stored
   *
   * The other parts are held until after the pause and then fail, so their
   * results must not reach the token.
   */
  ResumableUpload pauseAfterFirstPart() {
    Gate gate;
    store_->setInterceptor([&gate](const StoreRequest& request) -> std::optional<StoreError> {
      if (request.operation == StoreOperation::UPLOAD_PART && request.part_number != 1) {
        gate.wait();
        return StoreError{"InternalError", "held part released after pause", false};
      }
      return std::nullopt;
    });

    auto upload = first_->uploadFile(request_);
    const uint64_t part_size = GetParam().first.part_size_bytes;
    const uint64_t held = std::min<uint64_t>(
      partsOf(GetParam().first, kFileSize) - 1, GetParam().first.max_concurrency
    );
    EXPECT_TRUE(waitUntil([&]() {
      return upload->progress().transferred_bytes >= part_size &&
             static_cast<uint64_t>(gate.waiting()) == held;
    }));

    ResumableUpload token = upload->pause();
    EXPECT_EQ(upload->state(), TransferState::PAUSED);
    EXPECT_TRUE(upload->wait().paused());

    gate.open();
    EXPECT_TRUE(waitUntil([&]() {
      return gate.waiting() == 0;
    }));
    store_->clearInterceptor();

    // Held results were dropped, so the transfer stays paused
    EXPECT_EQ(upload->state(), TransferState::PAUSED);
    store_->resetRequestCounts();
    return token;
  }

  void expectObjectMatchesSource() {
    auto data = store_->objectData(request_.object());
    ASSERT_TRUE(data.has_value());
    EXPECT_TRUE(*data == readFile(request_.source));
  }

  std::string dir_;
  std::shared_ptr<MemoryObjectStore> store_;
  UploadFileRequest request_;
  std::unique_ptr<TransferManager> first_;
  std::unique_ptr<TransferManager> second_;
};

TEST_P(PauseResumeTest, SmallFilePausedImmediately) {
  request_.key = "data/small.bin";
  request_.source = generateTestFile(dir_ + "/small.bin", 2 * kMiB);

  Gate gate;
  store_->setInterceptor([&gate](const StoreRequest& request) -> std::optional<StoreError> {
    if (request.operation == StoreOperation::PUT_OBJECT) {
      gate.wait();
      return StoreError{"InternalError", "held request released after pause", false};
    }
    return std::nullopt;
  });

  auto upload = first_->uploadFile(request_);
  ASSERT_TRUE(waitUntil([&gate]() {
    return gate.waiting() == 1;
  }));
  ResumableUpload token = upload->pause();
  EXPECT_FALSE(token.hasMultipartState());
  EXPECT_EQ(token.file_length, 2 * kMiB);

  gate.open();
  ASSERT_TRUE(waitUntil([&gate]() {
    return gate.waiting() == 0;
  }));
  store_->clearInterceptor();
  EXPECT_EQ(upload->state(), TransferState::PAUSED);
  store_->resetRequestCounts();

  auto resumed = second_->resumeUploadFile(token);
  UploadResult result = resumed->wait();

  ASSERT_TRUE(result.success) << result.error_code << ": " << result.error_message;
  EXPECT_EQ(result.bytes_transferred, 2 * kMiB);
  EXPECT_EQ(*resumed->progress().total_bytes, 2 * kMiB);
  EXPECT_EQ(store_->requestCount(StoreOperation::PUT_OBJECT), 1u);
  EXPECT_EQ(store_->requestCount(StoreOperation::CREATE_MULTIPART_UPLOAD), 0u);
  expectObjectMatchesSource();
}

TEST_P(PauseResumeTest, ResumeUploadsOnlyMissingParts) {
  ResumableUpload token = pauseAfterFirstPart();

  ASSERT_TRUE(token.hasMultipartState());
  EXPECT_TRUE(token.isConsistent());
  EXPECT_EQ(*token.part_size_bytes, GetParam().first.part_size_bytes);
  EXPECT_EQ(*token.total_parts, partsOf(GetParam().first, kFileSize));
  ASSERT_EQ(token.transferred_parts->size(), 1u);
  EXPECT_EQ(token.transferred_parts->front().part_number, 1);
  EXPECT_TRUE(store_->hasUpload(*token.multipart_upload_id));

  auto resumed = second_->resumeUploadFile(token);
  UploadResult result = resumed->wait();

  ASSERT_TRUE(result.success) << result.error_code << ": " << result.error_message;
  EXPECT_EQ(result.bytes_transferred, kFileSize);
  EXPECT_EQ(resumed->state(), TransferState::COMPLETED);
  EXPECT_EQ(store_->requestCount(StoreOperation::LIST_PARTS), 1u);
  EXPECT_EQ(store_->requestCount(StoreOperation::CREATE_MULTIPART_UPLOAD), 0u);
  EXPECT_EQ(store_->requestCount(StoreOperation::UPLOAD_PART), *token.total_parts - 1);
  EXPECT_EQ(store_->requestCount(StoreOperation::COMPLETE_MULTIPART_UPLOAD), 1u);
  EXPECT_FALSE(store_->hasUpload(*token.multipart_upload_id));
  expectObjectMatchesSource();
}

TEST_P(PauseResumeTest, PauseBeforeMultipartUploadExistsRestarts) {
  Gate gate;
  store_->setInterceptor([&gate](const StoreRequest& request) -> std::optional<StoreError> {
    if (request.operation == StoreOperation::CREATE_MULTIPART_UPLOAD) {
      gate.wait();
    }
    return std::nullopt;
  });

  auto upload = first_->uploadFile(request_);
  ASSERT_TRUE(waitUntil([&gate]() {
    return gate.waiting() == 1;
  }));
  ResumableUpload token = upload->pause();
  EXPECT_FALSE(token.hasMultipartState());

  gate.open();
  ASSERT_TRUE(waitUntil([this]() {
    return store_->requestCount(StoreOperation::ABORT_MULTIPART_UPLOAD) == 1 &&
           store_->uploadCount() == 0;
  }));
  store_->clearInterceptor();
  store_->resetRequestCounts();

  UploadResult result = second_->resumeUploadFile(token)->wait();

  ASSERT_TRUE(result.success) << result.error_code << ": " << result.error_message;
  EXPECT_EQ(store_->requestCount(StoreOperation::LIST_PARTS), 0u);
  EXPECT_EQ(store_->requestCount(StoreOperation::CREATE_MULTIPART_UPLOAD), 1u);
  EXPECT_EQ(
    store_->requestCount(StoreOperation::UPLOAD_PART), partsOf(GetParam().second, kFileSize)
  );
  expectObjectMatchesSource();
}

TEST_P(PauseResumeTest, ChangedSourceAbortsAndRestarts) {
  ResumableUpload token = pauseAfterFirstPart();
  ASSERT_TRUE(token.hasMultipartState());
  const std::string old_upload_id = *token.multipart_upload_id;

  generateTestFile(request_.source, 10);
  std::filesystem::last_write_time(
    request_.source,
    std::filesystem::last_write_time(request_.source) + std::chrono::seconds(10)
  );

  UploadResult result = second_->resumeUploadFile(token)->wait();

  ASSERT_TRUE(result.success) << result.error_code << ": " << result.error_message;
  EXPECT_EQ(result.bytes_transferred, 10u);
  EXPECT_EQ(store_->requestCount(StoreOperation::ABORT_MULTIPART_UPLOAD), 1u);
  EXPECT_EQ(store_->requestCount(StoreOperation::LIST_PARTS), 0u);
  EXPECT_EQ(store_->requestCount(StoreOperation::PUT_OBJECT), 1u);
  EXPECT_EQ(store_->requestCount(StoreOperation::UPLOAD_PART), 0u);
  EXPECT_TRUE(store_->listParts(request_.object(), old_upload_id).error.is(
    error_codes::kNoSuchUpload
  ));
  expectObjectMatchesSource();
}

TEST_P(PauseResumeTest, VanishedUploadRestarts) {
  ResumableUpload token = pauseAfterFirstPart();
  ASSERT_TRUE(token.hasMultipartState());
  ASSERT_TRUE(store_->abortMultipartUpload(request_.object(), *token.multipart_upload_id).success);
  store_->resetRequestCounts();

  UploadResult result = second_->resumeUploadFile(token)->wait();

  ASSERT_TRUE(result.success) << result.error_code << ": " << result.error_message;
  EXPECT_EQ(result.bytes_transferred, kFileSize);
  EXPECT_EQ(store_->requestCount(StoreOperation::LIST_PARTS), 1u);
  EXPECT_EQ(store_->requestCount(StoreOperation::CREATE_MULTIPART_UPLOAD), 1u);
  EXPECT_EQ(
    store_->requestCount(StoreOperation::UPLOAD_PART), partsOf(GetParam().second, kFileSize)
  );
  expectObjectMatchesSource();
}

TEST_P(PauseResumeTest, TokenSurvivesSerialization) {
  ResumableUpload token = pauseAfterFirstPart();
  ResumableUpload restored = ResumableUpload::fromJson(token.toJson());

  UploadResult result = second_->resumeUploadFile(restored)->wait();

  ASSERT_TRUE(result.success) << result.error_code << ": " << result.error_message;
  EXPECT_EQ(store_->requestCount(StoreOperation::UPLOAD_PART), *token.total_parts - 1);
  expectObjectMatchesSource();
}

INSTANTIATE_TEST_SUITE_P(
  ManagerPairs, PauseResumeTest,
  ::testing::Values(
    ManagerPair{"SameLargeParts", configA(), configA()},
    ManagerPair{"SameSmallParts", configB(), configB()},
    ManagerPair{"SmallThenLarge", configB(), configA()},
    ManagerPair{"LargeThenSmall", configA(), configB()}
  ),
  [](const ::testing::TestParamInfo<ManagerPair>& info) {
    return info.param.name;
  }
);
