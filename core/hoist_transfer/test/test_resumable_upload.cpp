// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ResumableUpload (token shape and JSON form)
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <stdexcept>

#include "resumable_upload.hpp"

using namespace hoist::transfer;

namespace {

ResumableUpload singlePartToken() {
  ResumableUpload token;
  token.request.bucket = "bucket";
  token.request.key = "data/file.bin";
  token.request.source = "/tmp/file.bin";
  token.file_length = 2 * 1024 * 1024;
  token.file_last_modified_ns = 1700000000123456789LL;
  return token;
}

ResumableUpload multipartToken() {
  ResumableUpload token = singlePartToken();
  token.file_length = 24 * 1024 * 1024;
  token.multipart_upload_id = "upload-1";
  token.part_size_bytes = 8 * 1024 * 1024;
  token.total_parts = 3;
  token.transferred_parts = std::vector<CompletedPart>{{1, "etag-1", 8 * 1024 * 1024}};
  return token;
}

}  // namespace

TEST(ResumableUploadTest, EmptyMultipartStateIsConsistent) {
  auto token = singlePartToken();
  EXPECT_TRUE(token.isConsistent());
  EXPECT_FALSE(token.hasMultipartState());
  EXPECT_EQ(token.transferredBytes(), 0u);
}

TEST(ResumableUploadTest, PopulatedMultipartStateIsConsistent) {
  auto token = multipartToken();
  EXPECT_TRUE(token.isConsistent());
  EXPECT_TRUE(token.hasMultipartState());
  EXPECT_EQ(token.transferredBytes(), 8u * 1024 * 1024);
}

TEST(ResumableUploadTest, RegisteredWithoutPartsIsConsistent) {
  auto token = multipartToken();
  token.transferred_parts = std::vector<CompletedPart>{};
  EXPECT_TRUE(token.isConsistent());
  EXPECT_TRUE(token.hasMultipartState());
}

TEST(ResumableUploadTest, PartialMultipartStateIsInconsistent) {
  auto token = multipartToken();
  token.total_parts.reset();
  EXPECT_FALSE(token.isConsistent());
  EXPECT_FALSE(token.hasMultipartState());

  token = singlePartToken();
  token.multipart_upload_id = "upload-1";
  EXPECT_FALSE(token.isConsistent());
}

TEST(ResumableUploadTest, OutOfRangeOrDuplicatePartsAreInconsistent) {
  auto token = multipartToken();
  token.transferred_parts->push_back(CompletedPart{4, "etag-4", 1});
  EXPECT_FALSE(token.isConsistent());

  token = multipartToken();
  token.transferred_parts->push_back(CompletedPart{1, "etag-1b", 1});
  EXPECT_FALSE(token.isConsistent());
}

TEST(ResumableUploadTest, PartCountMustCoverFile) {
  auto token = multipartToken();
  token.total_parts = 2;  // 24 MB needs 3 parts of 8 MB
  EXPECT_FALSE(token.isConsistent());
}

TEST(ResumableUploadTest, JsonRoundTripKeepsEveryField) {
  auto token = multipartToken();
  token.request.content_type = "application/x-mcap";
  token.request.metadata = {{"owner", "robot-7"}};

  auto parsed = ResumableUpload::fromJson(token.toJson());

  EXPECT_EQ(parsed.request.bucket, "bucket");
  EXPECT_EQ(parsed.request.key, "data/file.bin");
  EXPECT_EQ(parsed.request.source, "/tmp/file.bin");
  EXPECT_EQ(parsed.request.content_type, "application/x-mcap");
  EXPECT_EQ(parsed.request.metadata.at("owner"), "robot-7");
  EXPECT_EQ(parsed.file_length, token.file_length);
  EXPECT_EQ(parsed.file_last_modified_ns, token.file_last_modified_ns);
  EXPECT_EQ(parsed.multipart_upload_id, token.multipart_upload_id);
  EXPECT_EQ(parsed.part_size_bytes, token.part_size_bytes);
  EXPECT_EQ(parsed.total_parts, token.total_parts);
  ASSERT_TRUE(parsed.transferred_parts.has_value());
  EXPECT_EQ(*parsed.transferred_parts, *token.transferred_parts);
}

TEST(ResumableUploadTest, EmptyStateOmitsMultipartFields) {
  auto json = nlohmann::json::parse(singlePartToken().toJson());
  EXPECT_FALSE(json.contains("multipart_upload_id"));
  EXPECT_FALSE(json.contains("transferred_parts"));

  auto parsed = ResumableUpload::fromJson(json.dump());
  EXPECT_FALSE(parsed.hasMultipartState());
}

TEST(ResumableUploadTest, EmptyPartListSurvivesJson) {
  auto token = multipartToken();
  token.transferred_parts = std::vector<CompletedPart>{};

  auto parsed = ResumableUpload::fromJson(token.toJson());
  ASSERT_TRUE(parsed.transferred_parts.has_value());
  EXPECT_TRUE(parsed.transferred_parts->empty());
}

TEST(ResumableUploadTest, NullFieldsAreAbsent) {
  auto json = nlohmann::json::parse(singlePartToken().toJson());
  json["multipart_upload_id"] = nullptr;
  auto parsed = ResumableUpload::fromJson(json.dump());
  EXPECT_FALSE(parsed.multipart_upload_id.has_value());
}

TEST(ResumableUploadTest, MalformedJsonThrows) {
  EXPECT_THROW(ResumableUpload::fromJson("not json"), std::invalid_argument);
  EXPECT_THROW(ResumableUpload::fromJson("[1, 2]"), std::invalid_argument);
  EXPECT_THROW(ResumableUpload::fromJson(R"({"bucket": "b"})"), std::invalid_argument);
}

TEST(ResumableUploadTest, InconsistentJsonThrows) {
  auto json = nlohmann::json::parse(multipartToken().toJson());
  json.erase("part_size_bytes");
  EXPECT_THROW(ResumableUpload::fromJson(json.dump()), std::invalid_argument);
}

TEST(ResumableUploadTest, UnknownVersionThrows) {
  auto json = nlohmann::json::parse(singlePartToken().toJson());
  json["version"] = 99;
  EXPECT_THROW(ResumableUpload::fromJson(json.dump()), std::invalid_argument);
}

TEST(ResumableUploadTest, ListenersAreNotSerialized) {
  auto token = singlePartToken();
  auto json = nlohmann::json::parse(token.toJson());
  EXPECT_FALSE(json.contains("listeners"));
}

TEST(ResumableUploadTest, DescribeMentionsUploadState) {
  auto description = multipartToken().describe();
  EXPECT_NE(description.find("bucket/data/file.bin"), std::string::npos);
  EXPECT_NE(description.find("upload_id=upload-1"), std::string::npos);
  EXPECT_NE(description.find("parts=1/3"), std::string::npos);

  EXPECT_NE(singlePartToken().describe().find("multipart=none"), std::string::npos);
}
