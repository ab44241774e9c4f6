// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_S3_OBJECT_STORE_HPP
#define HOIST_S3_OBJECT_STORE_HPP

#include <memory>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace hoist {
namespace transfer {

/**
 * S3 connection options
 */
struct S3StoreConfig {
  std::string endpoint_url;  // e.g. "http://localhost:9000"; empty for AWS S3
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;

  // SDK-internal HTTP retries. Transfer-level retries are done by the
  // TransferManager, so this stays 0 unless debugging a flaky link.
  int max_sdk_retries = 0;
};

/**
 * IObjectStore backed by the AWS SDK for C++
 *
 * Works with AWS S3 and S3-compatible services (MinIO). A custom endpoint
 * switches to path-style addressing.
 *
 * The SDK is initialized on first construction and shut down when the last
 * S3ObjectStore is destroyed.
 */
class S3ObjectStore : public IObjectStore {
public:
  explicit S3ObjectStore(const S3StoreConfig& config);
  ~S3ObjectStore() override;

  // Non-copyable, non-movable
  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;
  S3ObjectStore(S3ObjectStore&&) = delete;
  S3ObjectStore& operator=(S3ObjectStore&&) = delete;

  StoreResult<std::string> putObject(
    const ObjectKey& object, const std::string& body, const ObjectAttributes& attributes
  ) override;

  StoreResult<std::string> createMultipartUpload(
    const ObjectKey& object, const ObjectAttributes& attributes
  ) override;

  StoreResult<std::string> uploadPart(
    const ObjectKey& object, const std::string& upload_id, int part_number,
    const std::string& body
  ) override;

  StoreResult<std::string> completeMultipartUpload(
    const ObjectKey& object, const std::string& upload_id, const std::vector<CompletedPart>& parts
  ) override;

  StoreStatus abortMultipartUpload(const ObjectKey& object, const std::string& upload_id) override;

  /**
   * Follows pagination until every part is listed
   */
  StoreResult<std::vector<CompletedPart>> listParts(
    const ObjectKey& object, const std::string& upload_id
  ) override;

  /**
   * Follows pagination until every upload is listed
   */
  StoreResult<std::vector<MultipartUploadSummary>> listMultipartUploads(
    const std::string& bucket, const std::string& prefix = ""
  ) override;

  StoreResult<ObjectInfo> headObject(const ObjectKey& object) override;

  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_S3_OBJECT_STORE_HPP
