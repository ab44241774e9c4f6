// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_OBJECT_STORE_HPP
#define HOIST_OBJECT_STORE_HPP

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hoist {
namespace transfer {

// Error codes the transfer engine reacts to
namespace error_codes {
constexpr const char* kNoSuchUpload = "NoSuchUpload";
constexpr const char* kNoSuchKey = "NoSuchKey";
constexpr const char* kNoSuchBucket = "NoSuchBucket";
constexpr const char* kInvalidPart = "InvalidPart";
constexpr const char* kInvalidPartOrder = "InvalidPartOrder";
}  // namespace error_codes

/**
 * Error reported by an object store call
 */
struct StoreError {
  std::string code;     // S3-style error code, e.g. "NoSuchUpload"
  std::string message;  // Human readable message
  bool retryable = false;

  bool is(const char* error_code) const {
    return code == error_code;
  }
};

/**
 * Outcome of an object store call
 *
 * Either success with a value, or failure with a StoreError.
 */
template<typename T>
struct StoreResult {
  bool success = false;
  T value{};
  StoreError error;

  static StoreResult Ok(T result_value) {
    StoreResult result;
    result.success = true;
    result.value = std::move(result_value);
    return result;
  }

  static StoreResult Fail(StoreError store_error) {
    StoreResult result;
    result.error = std::move(store_error);
    return result;
  }

  static StoreResult Fail(const std::string& code, const std::string& message, bool retryable) {
    return Fail(StoreError{code, message, retryable});
  }
};

// For calls that only report success or failure
using StoreStatus = StoreResult<bool>;

/**
 * Destination of an upload
 */
struct ObjectKey {
  std::string bucket;
  std::string key;

  std::string str() const {
    return bucket + "/" + key;
  }
};

/**
 * Attributes attached to a stored object
 */
struct ObjectAttributes {
  std::string content_type = "application/octet-stream";
  std::map<std::string, std::string> metadata;  // Keys without the x-amz-meta- prefix
};

/**
 * A part acknowledged by the store
 */
struct CompletedPart {
  int part_number = 0;
  std::string etag;
  uint64_t size_bytes = 0;

  bool operator==(const CompletedPart& other) const {
    return part_number == other.part_number && etag == other.etag &&
           size_bytes == other.size_bytes;
  }
};

/**
 * An in-progress multipart upload as reported by ListMultipartUploads
 */
struct MultipartUploadSummary {
  std::string key;
  std::string upload_id;
};

/**
 * Metadata of a stored object as reported by HeadObject
 */
struct ObjectInfo {
  uint64_t size_bytes = 0;
  std::string etag;
  std::string content_type;
  std::map<std::string, std::string> metadata;
};

/**
 * Object storage operations the transfer engine consumes
 *
 * Implementations must be thread-safe: part uploads for one transfer are
 * issued concurrently from the transfer worker pool.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  /**
   * Store a whole object in a single request
   * @return ETag of the stored object
   */
  virtual StoreResult<std::string> putObject(
    const ObjectKey& object, const std::string& body, const ObjectAttributes& attributes
  ) = 0;

  /**
   * Register a multipart upload
   * @return The new upload id
   */
  virtual StoreResult<std::string> createMultipartUpload(
    const ObjectKey& object, const ObjectAttributes& attributes
  ) = 0;

  /**
   * Upload one part (part numbers start at 1)
   * @return ETag of the part
   */
  virtual StoreResult<std::string> uploadPart(
    const ObjectKey& object, const std::string& upload_id, int part_number,
    const std::string& body
  ) = 0;

  /**
   * Assemble the listed parts into the final object
   * @param parts Parts in ascending part-number order
   * @return ETag of the assembled object
   */
  virtual StoreResult<std::string> completeMultipartUpload(
    const ObjectKey& object, const std::string& upload_id, const std::vector<CompletedPart>& parts
  ) = 0;

  /**
   * Discard a multipart upload and its parts
   */
  virtual StoreStatus abortMultipartUpload(
    const ObjectKey& object, const std::string& upload_id
  ) = 0;

  /**
   * List the parts uploaded so far, ordered by part number
   *
   * Fails with NoSuchUpload once the upload was completed or aborted.
   */
  virtual StoreResult<std::vector<CompletedPart>> listParts(
    const ObjectKey& object, const std::string& upload_id
  ) = 0;

  /**
   * List in-progress multipart uploads in a bucket
   */
  virtual StoreResult<std::vector<MultipartUploadSummary>> listMultipartUploads(
    const std::string& bucket, const std::string& prefix = ""
  ) = 0;

  /**
   * Fetch object metadata
   */
  virtual StoreResult<ObjectInfo> headObject(const ObjectKey& object) = 0;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_OBJECT_STORE_HPP
