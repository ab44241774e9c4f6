// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "memory_object_store.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace hoist {
namespace transfer {

namespace {

constexpr int kMaxPartNumber = 10000;

// Raw MD5 digest, empty on failure
std::string md5Digest(const std::string& data) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return "";
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  bool ok = EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) == 1 &&
            EVP_DigestUpdate(ctx, data.data(), data.size()) == 1 &&
            EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
  EVP_MD_CTX_free(ctx);

  if (!ok) {
    return "";
  }
  return std::string(reinterpret_cast<const char*>(hash), hash_len);
}

std::string toHex(const std::string& bytes) {
  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned char c : bytes) {
    ss << std::setw(2) << static_cast<unsigned>(c);
  }
  return ss.str();
}

StoreError noSuchUpload(const std::string& upload_id) {
  return StoreError{
    error_codes::kNoSuchUpload, "The specified multipart upload does not exist: " + upload_id,
    false};
}

}  // namespace

std::string storeOperationToString(StoreOperation operation) {
  switch (operation) {
    case StoreOperation::PUT_OBJECT:
      return "PutObject";
    case StoreOperation::CREATE_MULTIPART_UPLOAD:
      return "CreateMultipartUpload";
    case StoreOperation::UPLOAD_PART:
      return "UploadPart";
    case StoreOperation::COMPLETE_MULTIPART_UPLOAD:
      return "CompleteMultipartUpload";
    case StoreOperation::ABORT_MULTIPART_UPLOAD:
      return "AbortMultipartUpload";
    case StoreOperation::LIST_PARTS:
      return "ListParts";
    case StoreOperation::LIST_MULTIPART_UPLOADS:
      return "ListMultipartUploads";
    case StoreOperation::HEAD_OBJECT:
      return "HeadObject";
    default:
      return "Unknown";
  }
}

MemoryObjectStore::MemoryObjectStore(uint64_t min_part_size_bytes)
    : min_part_size_bytes_(min_part_size_bytes) {}

void MemoryObjectStore::createBucket(const std::string& bucket) {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.insert(bucket);
}

bool MemoryObjectStore::hasBucket(const std::string& bucket) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.count(bucket) > 0;
}

void MemoryObjectStore::setInterceptor(RequestInterceptor interceptor) {
  std::lock_guard<std::mutex> lock(interceptor_mutex_);
  interceptor_ = std::move(interceptor);
}

void MemoryObjectStore::clearInterceptor() {
  setInterceptor(nullptr);
}

uint64_t MemoryObjectStore::requestCount(StoreOperation operation) const {
  return request_counts_[static_cast<size_t>(operation)].load();
}

void MemoryObjectStore::resetRequestCounts() {
  for (auto& count : request_counts_) {
    count.store(0);
  }
}

std::optional<std::string> MemoryObjectStore::objectData(const ObjectKey& object) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(object.str());
  if (it == objects_.end()) {
    return std::nullopt;
  }
  return it->second.data;
}

bool MemoryObjectStore::hasUpload(const std::string& upload_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return uploads_.count(upload_id) > 0;
}

size_t MemoryObjectStore::uploadCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return uploads_.size();
}

std::optional<StoreError> MemoryObjectStore::intercept(const StoreRequest& request) {
  request_counts_[static_cast<size_t>(request.operation)].fetch_add(1);

  RequestInterceptor interceptor;
  {
    std::lock_guard<std::mutex> lock(interceptor_mutex_);
    interceptor = interceptor_;
  }
  if (!interceptor) {
    return std::nullopt;
  }
  return interceptor(request);
}

std::optional<StoreError> MemoryObjectStore::checkBucket(const std::string& bucket) const {
  if (buckets_.count(bucket) == 0) {
    return StoreError{
      error_codes::kNoSuchBucket, "The specified bucket does not exist: " + bucket, false};
  }
  return std::nullopt;
}

std::optional<StoreError> MemoryObjectStore::findUpload(
  const ObjectKey& object, const std::string& upload_id, PendingUpload*& upload
) {
  auto it = uploads_.find(upload_id);
  if (it == uploads_.end() || it->second.object.bucket != object.bucket ||
      it->second.object.key != object.key) {
    return noSuchUpload(upload_id);
  }
  upload = &it->second;
  return std::nullopt;
}

StoreResult<std::string> MemoryObjectStore::putObject(
  const ObjectKey& object, const std::string& body, const ObjectAttributes& attributes
) {
  if (auto error = intercept({StoreOperation::PUT_OBJECT, object, "", 0})) {
    return StoreResult<std::string>::Fail(*error);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = checkBucket(object.bucket)) {
    return StoreResult<std::string>::Fail(*error);
  }

  StoredObject stored;
  stored.data = body;
  stored.etag = toHex(md5Digest(body));
  stored.attributes = attributes;
  std::string etag = stored.etag;
  objects_[object.str()] = std::move(stored);
  return StoreResult<std::string>::Ok(etag);
}

StoreResult<std::string> MemoryObjectStore::createMultipartUpload(
  const ObjectKey& object, const ObjectAttributes& attributes
) {
  if (auto error = intercept({StoreOperation::CREATE_MULTIPART_UPLOAD, object, "", 0})) {
    return StoreResult<std::string>::Fail(*error);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = checkBucket(object.bucket)) {
    return StoreResult<std::string>::Fail(*error);
  }

  std::string upload_id = "mem-upload-" + std::to_string(++next_upload_id_);
  PendingUpload upload;
  upload.object = object;
  upload.attributes = attributes;
  uploads_[upload_id] = std::move(upload);
  return StoreResult<std::string>::Ok(upload_id);
}

StoreResult<std::string> MemoryObjectStore::uploadPart(
  const ObjectKey& object, const std::string& upload_id, int part_number, const std::string& body
) {
  if (auto error = intercept({StoreOperation::UPLOAD_PART, object, upload_id, part_number})) {
    return StoreResult<std::string>::Fail(*error);
  }

  if (part_number < 1 || part_number > kMaxPartNumber) {
    return StoreResult<std::string>::Fail(
      "InvalidArgument", "Part number must be between 1 and 10000", false
    );
  }

  std::lock_guard<std::mutex> lock(mutex_);
  PendingUpload* upload = nullptr;
  if (auto error = findUpload(object, upload_id, upload)) {
    return StoreResult<std::string>::Fail(*error);
  }

  StoredPart part;
  part.data = body;
  part.etag = toHex(md5Digest(body));
  std::string etag = part.etag;
  upload->parts[part_number] = std::move(part);
  return StoreResult<std::string>::Ok(etag);
}

StoreResult<std::string> MemoryObjectStore::completeMultipartUpload(
  const ObjectKey& object, const std::string& upload_id, const std::vector<CompletedPart>& parts
) {
  if (auto error = intercept({StoreOperation::COMPLETE_MULTIPART_UPLOAD, object, upload_id, 0})) {
    return StoreResult<std::string>::Fail(*error);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  PendingUpload* upload = nullptr;
  if (auto error = findUpload(object, upload_id, upload)) {
    return StoreResult<std::string>::Fail(*error);
  }

  if (parts.empty()) {
    return StoreResult<std::string>::Fail(
      "MalformedXML", "At least one part must be specified", false
    );
  }

  std::string data;
  std::string digests;
  int previous = 0;
  for (size_t i = 0; i < parts.size(); ++i) {
    const auto& requested = parts[i];
    if (requested.part_number <= previous) {
      return StoreResult<std::string>::Fail(
        error_codes::kInvalidPartOrder, "Parts must be listed in ascending order", false
      );
    }
    previous = requested.part_number;

    auto it = upload->parts.find(requested.part_number);
    if (it == upload->parts.end() || it->second.etag != requested.etag) {
      return StoreResult<std::string>::Fail(
        error_codes::kInvalidPart,
        "Part " + std::to_string(requested.part_number) + " not found or ETag mismatch", false
      );
    }

    const bool last = (i + 1 == parts.size());
    if (!last && min_part_size_bytes_ > 0 && it->second.data.size() < min_part_size_bytes_) {
      return StoreResult<std::string>::Fail(
        "EntityTooSmall",
        "Part " + std::to_string(requested.part_number) + " is smaller than the minimum size",
        false
      );
    }

    data += it->second.data;
    digests += md5Digest(it->second.data);
  }

  StoredObject stored;
  stored.data = std::move(data);
  stored.etag = toHex(md5Digest(digests)) + "-" + std::to_string(parts.size());
  stored.attributes = upload->attributes;
  std::string etag = stored.etag;

  objects_[object.str()] = std::move(stored);
  uploads_.erase(upload_id);
  return StoreResult<std::string>::Ok(etag);
}

StoreStatus MemoryObjectStore::abortMultipartUpload(
  const ObjectKey& object, const std::string& upload_id
) {
  if (auto error = intercept({StoreOperation::ABORT_MULTIPART_UPLOAD, object, upload_id, 0})) {
    return StoreStatus::Fail(*error);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  PendingUpload* upload = nullptr;
  if (auto error = findUpload(object, upload_id, upload)) {
    return StoreStatus::Fail(*error);
  }
  uploads_.erase(upload_id);
  return StoreStatus::Ok(true);
}

StoreResult<std::vector<CompletedPart>> MemoryObjectStore::listParts(
  const ObjectKey& object, const std::string& upload_id
) {
  using Result = StoreResult<std::vector<CompletedPart>>;
  if (auto error = intercept({StoreOperation::LIST_PARTS, object, upload_id, 0})) {
    return Result::Fail(*error);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  PendingUpload* upload = nullptr;
  if (auto error = findUpload(object, upload_id, upload)) {
    return Result::Fail(*error);
  }

  std::vector<CompletedPart> parts;
  parts.reserve(upload->parts.size());
  for (const auto& [number, part] : upload->parts) {
    parts.push_back(CompletedPart{number, part.etag, part.data.size()});
  }
  return Result::Ok(std::move(parts));
}

StoreResult<std::vector<MultipartUploadSummary>> MemoryObjectStore::listMultipartUploads(
  const std::string& bucket, const std::string& prefix
) {
  using Result = StoreResult<std::vector<MultipartUploadSummary>>;
  if (auto error =
        intercept({StoreOperation::LIST_MULTIPART_UPLOADS, ObjectKey{bucket, ""}, "", 0})) {
    return Result::Fail(*error);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = checkBucket(bucket)) {
    return Result::Fail(*error);
  }

  std::vector<MultipartUploadSummary> summaries;
  for (const auto& [upload_id, upload] : uploads_) {
    if (upload.object.bucket != bucket) {
      continue;
    }
    if (upload.object.key.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    summaries.push_back(MultipartUploadSummary{upload.object.key, upload_id});
  }
  return Result::Ok(std::move(summaries));
}

StoreResult<ObjectInfo> MemoryObjectStore::headObject(const ObjectKey& object) {
  if (auto error = intercept({StoreOperation::HEAD_OBJECT, object, "", 0})) {
    return StoreResult<ObjectInfo>::Fail(*error);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto error = checkBucket(object.bucket)) {
    return StoreResult<ObjectInfo>::Fail(*error);
  }

  auto it = objects_.find(object.str());
  if (it == objects_.end()) {
    return StoreResult<ObjectInfo>::Fail(
      error_codes::kNoSuchKey, "The specified key does not exist: " + object.key, false
    );
  }

  ObjectInfo info;
  info.size_bytes = it->second.data.size();
  info.etag = it->second.etag;
  info.content_type = it->second.attributes.content_type;
  info.metadata = it->second.attributes.metadata;
  return StoreResult<ObjectInfo>::Ok(std::move(info));
}

}  // namespace transfer
}  // namespace hoist
