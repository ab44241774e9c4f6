// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for MemoryObjectStore
 *
 * The in-memory store stands in for S3 in the transfer tests, so its error
 * behavior has to match what the S3 client reports.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "memory_object_store.hpp"
#include "test_helpers.hpp"

using namespace hoist::transfer;
using namespace hoist::transfer::test;

class MemoryObjectStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_.createBucket("bucket");
  }

  std::string createUpload() {
    auto result = store_.createMultipartUpload(object_, attributes_);
    EXPECT_TRUE(result.success);
    return result.value;
  }

  CompletedPart upload(const std::string& upload_id, int part_number, const std::string& body) {
    auto result = store_.uploadPart(object_, upload_id, part_number, body);
    EXPECT_TRUE(result.success) << result.error.message;
    return CompletedPart{part_number, result.value, body.size()};
  }

  MemoryObjectStore store_;
  ObjectKey object_{"bucket", "dir/object.bin"};
  ObjectAttributes attributes_;
};

// ============================================================================
// Single requests
// ============================================================================

TEST_F(MemoryObjectStoreTest, PutObjectReturnsMd5Etag) {
  auto result = store_.putObject(object_, "hello", attributes_);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.value, "5d41402abc4b2a76b9719d911017c592");
  EXPECT_EQ(*store_.objectData(object_), "hello");
}

TEST_F(MemoryObjectStoreTest, PutEmptyObject) {
  auto result = store_.putObject(object_, "", attributes_);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.value, "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(*store_.objectData(object_), "");
}

TEST_F(MemoryObjectStoreTest, MissingBucketIsReported) {
  ObjectKey missing{"other", "key"};
  auto put = store_.putObject(missing, "x", attributes_);
  EXPECT_FALSE(put.success);
  EXPECT_TRUE(put.error.is(error_codes::kNoSuchBucket));
  EXPECT_FALSE(put.error.retryable);

  auto create = store_.createMultipartUpload(missing, attributes_);
  EXPECT_TRUE(create.error.is(error_codes::kNoSuchBucket));

  auto list = store_.listMultipartUploads("other");
  EXPECT_TRUE(list.error.is(error_codes::kNoSuchBucket));
}

TEST_F(MemoryObjectStoreTest, HeadObjectReportsAttributes) {
  attributes_.content_type = "text/plain";
  attributes_.metadata["origin"] = "test";
  ASSERT_TRUE(store_.putObject(object_, "hello", attributes_).success);

  auto head = store_.headObject(object_);
  ASSERT_TRUE(head.success);
  EXPECT_EQ(head.value.size_bytes, 5u);
  EXPECT_EQ(head.value.content_type, "text/plain");
  EXPECT_EQ(head.value.metadata.at("origin"), "test");

  auto missing = store_.headObject(ObjectKey{"bucket", "absent"});
  EXPECT_TRUE(missing.error.is(error_codes::kNoSuchKey));
}

// ============================================================================
// Multipart uploads
// ============================================================================

TEST_F(MemoryObjectStoreTest, MultipartAssemblesPartsInOrder) {
  std::string upload_id = createUpload();
  EXPECT_TRUE(store_.hasUpload(upload_id));

  auto p2 = upload(upload_id, 2, "world");
  auto p1 = upload(upload_id, 1, "hello ");

  auto complete = store_.completeMultipartUpload(object_, upload_id, {p1, p2});
  ASSERT_TRUE(complete.success) << complete.error.message;
  EXPECT_EQ(complete.value.size(), 32u + 2u);
  EXPECT_EQ(complete.value.substr(32), "-2");
  EXPECT_EQ(*store_.objectData(object_), "hello world");
  EXPECT_FALSE(store_.hasUpload(upload_id));
}

TEST_F(MemoryObjectStoreTest, UploadIdsAreUnique) {
  std::string a = createUpload();
  std::string b = createUpload();
  EXPECT_NE(a, b);
  EXPECT_EQ(store_.uploadCount(), 2u);
}

TEST_F(MemoryObjectStoreTest, ReuploadedPartReplacesPrevious) {
  std::string upload_id = createUpload();
  upload(upload_id, 1, "first");
  auto replaced = upload(upload_id, 1, "second");

  auto parts = store_.listParts(object_, upload_id);
  ASSERT_TRUE(parts.success);
  ASSERT_EQ(parts.value.size(), 1u);
  EXPECT_EQ(parts.value[0], replaced);
}

TEST_F(MemoryObjectStoreTest, ListPartsIsOrderedByPartNumber) {
  std::string upload_id = createUpload();
  upload(upload_id, 3, "ccc");
  upload(upload_id, 1, "a");
  upload(upload_id, 2, "bb");

  auto parts = store_.listParts(object_, upload_id);
  ASSERT_TRUE(parts.success);
  ASSERT_EQ(parts.value.size(), 3u);
  for (size_t i = 0; i < parts.value.size(); ++i) {
    EXPECT_EQ(parts.value[i].part_number, static_cast<int>(i + 1));
    EXPECT_EQ(parts.value[i].size_bytes, i + 1);
  }
}

TEST_F(MemoryObjectStoreTest, PartNumberOutOfRange) {
  std::string upload_id = createUpload();
  EXPECT_EQ(store_.uploadPart(object_, upload_id, 0, "x").error.code, "InvalidArgument");
  EXPECT_EQ(store_.uploadPart(object_, upload_id, 10001, "x").error.code, "InvalidArgument");
  EXPECT_TRUE(store_.uploadPart(object_, upload_id, 10000, "x").success);
}

TEST_F(MemoryObjectStoreTest, CompletedUploadIsGone) {
  std::string upload_id = createUpload();
  auto p1 = upload(upload_id, 1, "data");
  ASSERT_TRUE(store_.completeMultipartUpload(object_, upload_id, {p1}).success);

  auto parts = store_.listParts(object_, upload_id);
  EXPECT_FALSE(parts.success);
  EXPECT_TRUE(parts.error.is(error_codes::kNoSuchUpload));
  EXPECT_FALSE(parts.error.retryable);

  EXPECT_TRUE(store_.uploadPart(object_, upload_id, 2, "x").error.is(error_codes::kNoSuchUpload));
  EXPECT_TRUE(
    store_.abortMultipartUpload(object_, upload_id).error.is(error_codes::kNoSuchUpload)
  );
}

TEST_F(MemoryObjectStoreTest, AbortedUploadIsGone) {
  std::string upload_id = createUpload();
  upload(upload_id, 1, "data");
  ASSERT_TRUE(store_.abortMultipartUpload(object_, upload_id).success);

  EXPECT_FALSE(store_.hasUpload(upload_id));
  EXPECT_TRUE(store_.listParts(object_, upload_id).error.is(error_codes::kNoSuchUpload));
  EXPECT_FALSE(store_.objectData(object_).has_value());
}

TEST_F(MemoryObjectStoreTest, UploadIdBelongsToItsObject) {
  std::string upload_id = createUpload();
  ObjectKey other{"bucket", "other.bin"};
  EXPECT_TRUE(store_.listParts(other, upload_id).error.is(error_codes::kNoSuchUpload));
  EXPECT_TRUE(store_.uploadPart(other, upload_id, 1, "x").error.is(error_codes::kNoSuchUpload));
}

TEST_F(MemoryObjectStoreTest, CompleteValidatesPartList) {
  std::string upload_id = createUpload();
  auto p1 = upload(upload_id, 1, "aaa");
  auto p2 = upload(upload_id, 2, "bbb");

  EXPECT_EQ(store_.completeMultipartUpload(object_, upload_id, {}).error.code, "MalformedXML");
  EXPECT_TRUE(store_.completeMultipartUpload(object_, upload_id, {p2, p1})
                .error.is(error_codes::kInvalidPartOrder));

  CompletedPart wrong_etag = p2;
  wrong_etag.etag = "0000";
  EXPECT_TRUE(store_.completeMultipartUpload(object_, upload_id, {p1, wrong_etag})
                .error.is(error_codes::kInvalidPart));

  CompletedPart missing{3, p1.etag, 3};
  EXPECT_TRUE(store_.completeMultipartUpload(object_, upload_id, {p1, p2, missing})
                .error.is(error_codes::kInvalidPart));

  // Failed completions leave the upload in place
  EXPECT_TRUE(store_.hasUpload(upload_id));
  EXPECT_TRUE(store_.completeMultipartUpload(object_, upload_id, {p1, p2}).success);
}

TEST_F(MemoryObjectStoreTest, MinimumPartSizeExemptsLastPart) {
  MemoryObjectStore store(4);
  store.createBucket("bucket");
  auto upload_id = store.createMultipartUpload(object_, attributes_).value;

  auto small = store.uploadPart(object_, upload_id, 1, "ab");
  auto last = store.uploadPart(object_, upload_id, 2, "c");
  auto too_small = store.completeMultipartUpload(
    object_, upload_id, {CompletedPart{1, small.value, 2}, CompletedPart{2, last.value, 1}}
  );
  EXPECT_EQ(too_small.error.code, "EntityTooSmall");

  auto big = store.uploadPart(object_, upload_id, 1, "abcd");
  auto ok = store.completeMultipartUpload(
    object_, upload_id, {CompletedPart{1, big.value, 4}, CompletedPart{2, last.value, 1}}
  );
  EXPECT_TRUE(ok.success) << ok.error.message;
  EXPECT_EQ(*store.objectData(object_), "abcdc");
}

TEST_F(MemoryObjectStoreTest, ListMultipartUploadsFiltersByPrefix) {
  std::string a = createUpload();
  ASSERT_TRUE(store_.createMultipartUpload(ObjectKey{"bucket", "other/x"}, attributes_).success);

  auto all = store_.listMultipartUploads("bucket");
  ASSERT_TRUE(all.success);
  EXPECT_EQ(all.value.size(), 2u);

  auto filtered = store_.listMultipartUploads("bucket", "dir/");
  ASSERT_TRUE(filtered.success);
  ASSERT_EQ(filtered.value.size(), 1u);
  EXPECT_EQ(filtered.value[0].upload_id, a);
  EXPECT_EQ(filtered.value[0].key, object_.key);
}

// ============================================================================
// Interceptor and counters
// ============================================================================

TEST_F(MemoryObjectStoreTest, InterceptorErrorHasNoSideEffects) {
  std::string upload_id = createUpload();
  store_.setInterceptor([](const StoreRequest& request) -> std::optional<StoreError> {
    if (request.operation == StoreOperation::UPLOAD_PART && request.part_number == 2) {
      return StoreError{"ServiceUnavailable", "injected", true};
    }
    return std::nullopt;
  });

  EXPECT_TRUE(store_.uploadPart(object_, upload_id, 1, "a").success);
  auto failed = store_.uploadPart(object_, upload_id, 2, "b");
  EXPECT_FALSE(failed.success);
  EXPECT_EQ(failed.error.code, "ServiceUnavailable");
  EXPECT_TRUE(failed.error.retryable);

  auto parts = store_.listParts(object_, upload_id);
  ASSERT_EQ(parts.value.size(), 1u);

  store_.clearInterceptor();
  EXPECT_TRUE(store_.uploadPart(object_, upload_id, 2, "b").success);
}

TEST_F(MemoryObjectStoreTest, InterceptorSeesRequestDetails) {
  std::vector<StoreRequest> seen;
  std::mutex mutex;
  store_.setInterceptor([&](const StoreRequest& request) -> std::optional<StoreError> {
    std::lock_guard<std::mutex> lock(mutex);
    seen.push_back(request);
    return std::nullopt;
  });

  std::string upload_id = createUpload();
  upload(upload_id, 7, "x");
  store_.clearInterceptor();

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0].operation, StoreOperation::CREATE_MULTIPART_UPLOAD);
  EXPECT_EQ(seen[1].operation, StoreOperation::UPLOAD_PART);
  EXPECT_EQ(seen[1].upload_id, upload_id);
  EXPECT_EQ(seen[1].part_number, 7);
  EXPECT_EQ(seen[1].object.key, object_.key);
}

TEST_F(MemoryObjectStoreTest, CountsIncludeFailedRequests) {
  store_.setInterceptor([](const StoreRequest&) -> std::optional<StoreError> {
    return StoreError{"InternalError", "injected", true};
  });
  store_.putObject(object_, "x", attributes_);
  store_.putObject(object_, "x", attributes_);
  store_.clearInterceptor();
  store_.headObject(object_);

  EXPECT_EQ(store_.requestCount(StoreOperation::PUT_OBJECT), 2u);
  EXPECT_EQ(store_.requestCount(StoreOperation::HEAD_OBJECT), 1u);
  EXPECT_EQ(store_.requestCount(StoreOperation::UPLOAD_PART), 0u);

  store_.resetRequestCounts();
  EXPECT_EQ(store_.requestCount(StoreOperation::PUT_OBJECT), 0u);
}

TEST_F(MemoryObjectStoreTest, ConcurrentPartUploads) {
  std::string upload_id = createUpload();
  std::vector<std::thread> threads;
  for (int part = 1; part <= 16; ++part) {
    threads.emplace_back([this, &upload_id, part]() {
      store_.uploadPart(object_, upload_id, part, std::string(100, static_cast<char>('a' + part)));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto parts = store_.listParts(object_, upload_id);
  ASSERT_TRUE(parts.success);
  EXPECT_EQ(parts.value.size(), 16u);
  EXPECT_EQ(store_.requestCount(StoreOperation::UPLOAD_PART), 16u);
}

TEST(StoreOperationTest, NamesMatchS3Operations) {
  EXPECT_EQ(storeOperationToString(StoreOperation::PUT_OBJECT), "PutObject");
  EXPECT_EQ(storeOperationToString(StoreOperation::UPLOAD_PART), "UploadPart");
  EXPECT_EQ(storeOperationToString(StoreOperation::LIST_PARTS), "ListParts");
  EXPECT_EQ(
    storeOperationToString(StoreOperation::COMPLETE_MULTIPART_UPLOAD), "CompleteMultipartUpload"
  );
}
