// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_MEMORY_OBJECT_STORE_HPP
#define HOIST_MEMORY_OBJECT_STORE_HPP

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace hoist {
namespace transfer {

enum class StoreOperation {
  PUT_OBJECT,
  CREATE_MULTIPART_UPLOAD,
  UPLOAD_PART,
  COMPLETE_MULTIPART_UPLOAD,
  ABORT_MULTIPART_UPLOAD,
  LIST_PARTS,
  LIST_MULTIPART_UPLOADS,
  HEAD_OBJECT,
};

constexpr size_t kStoreOperationCount = 8;

std::string storeOperationToString(StoreOperation operation);

/**
 * Request as seen by a RequestInterceptor
 */
struct StoreRequest {
  StoreOperation operation = StoreOperation::PUT_OBJECT;
  ObjectKey object;       // bucket only for LIST_MULTIPART_UPLOADS
  std::string upload_id;  // Multipart operations
  int part_number = 0;    // UPLOAD_PART
};

/**
 * Hook run before a request touches the store
 *
 * May block to delay the request. Returning an error fails the request
 * without side effects. Runs without the store lock held.
 */
using RequestInterceptor = std::function<std::optional<StoreError>(const StoreRequest&)>;

/**
 * IObjectStore kept in process memory with S3 semantics
 *
 * - Buckets must be created before use (NoSuchBucket otherwise)
 * - Completion requires ascending part numbers with matching ETags
 * - Completing or aborting an upload removes it (later calls get NoSuchUpload)
 * - ETags are MD5 hex digests; multipart ETags use the "<md5>-<parts>" form
 *
 * Thread-safe.
 */
class MemoryObjectStore : public IObjectStore {
public:
  /**
   * @param min_part_size_bytes Minimum size of every part but the last,
   *        enforced on completion (EntityTooSmall). 0 disables the check.
   */
  explicit MemoryObjectStore(uint64_t min_part_size_bytes = 0);

  void createBucket(const std::string& bucket);
  bool hasBucket(const std::string& bucket) const;

  void setInterceptor(RequestInterceptor interceptor);
  void clearInterceptor();

  uint64_t requestCount(StoreOperation operation) const;
  void resetRequestCounts();

  // Test inspection
  std::optional<std::string> objectData(const ObjectKey& object) const;
  bool hasUpload(const std::string& upload_id) const;
  size_t uploadCount() const;

  // IObjectStore
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

  StoreResult<std::vector<CompletedPart>> listParts(
    const ObjectKey& object, const std::string& upload_id
  ) override;

  StoreResult<std::vector<MultipartUploadSummary>> listMultipartUploads(
    const std::string& bucket, const std::string& prefix = ""
  ) override;

  StoreResult<ObjectInfo> headObject(const ObjectKey& object) override;

private:
  struct StoredObject {
    std::string data;
    std::string etag;
    ObjectAttributes attributes;
  };

  struct StoredPart {
    std::string data;
    std::string etag;
  };

  struct PendingUpload {
    ObjectKey object;
    ObjectAttributes attributes;
    std::map<int, StoredPart> parts;
  };

  // Counts the request and runs the interceptor
  std::optional<StoreError> intercept(const StoreRequest& request);

  // Caller holds mutex_
  std::optional<StoreError> checkBucket(const std::string& bucket) const;
  std::optional<StoreError> findUpload(
    const ObjectKey& object, const std::string& upload_id, PendingUpload*& upload
  );

  const uint64_t min_part_size_bytes_;

  mutable std::mutex mutex_;
  std::set<std::string> buckets_;
  std::map<std::string, StoredObject> objects_;  // Keyed by ObjectKey::str()
  std::map<std::string, PendingUpload> uploads_;
  uint64_t next_upload_id_ = 0;

  mutable std::mutex interceptor_mutex_;
  RequestInterceptor interceptor_;

  std::array<std::atomic<uint64_t>, kStoreOperationCount> request_counts_{};
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_MEMORY_OBJECT_STORE_HPP
