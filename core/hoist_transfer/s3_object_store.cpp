// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListMultipartUploadsRequest.h>
#include <aws/s3/model/ListPartsRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <cstdlib>
#include <mutex>

#include "retry_handler.hpp"

#define HOIST_LOG_COMPONENT "s3_object_store"
#include <hoist_log_macros.hpp>

namespace hoist {
namespace transfer {

using hoist::logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// The AWS SDK requires InitAPI/ShutdownAPI to be called exactly once per process.
// We use a reference-counted singleton to manage this lifecycle.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

namespace {

std::string stripQuotes(const Aws::String& etag) {
  std::string value(etag.c_str(), etag.size());
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

// Map an SDK error onto the codes the transfer engine understands
template<typename ErrorT>
StoreError toStoreError(const ErrorT& error) {
  StoreError result;
  switch (error.GetErrorType()) {
    case Aws::S3::S3Errors::NO_SUCH_UPLOAD:
      result.code = error_codes::kNoSuchUpload;
      break;
    case Aws::S3::S3Errors::NO_SUCH_KEY:
    case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
      result.code = error_codes::kNoSuchKey;
      break;
    case Aws::S3::S3Errors::NO_SUCH_BUCKET:
      result.code = error_codes::kNoSuchBucket;
      break;
    default:
      result.code = std::string(error.GetExceptionName().c_str());
      break;
  }
  if (result.code.empty()) {
    result.code = "UnknownError";
  }
  result.message = std::string(error.GetMessage().c_str());
  if (result.message.empty()) {
    result.message = "HTTP " + std::to_string(static_cast<int>(error.GetResponseCode()));
  }
  result.retryable = RetryHandler::isRetryableError(result.code) || error.ShouldRetry();
  return result;
}

std::shared_ptr<Aws::IOStream> makeBody(const std::string& body) {
  auto stream = Aws::MakeShared<Aws::StringStream>("HoistS3Body");
  stream->write(body.data(), static_cast<std::streamsize>(body.size()));
  return stream;
}

Aws::Map<Aws::String, Aws::String> toAwsMetadata(const std::map<std::string, std::string>& metadata) {
  Aws::Map<Aws::String, Aws::String> aws_metadata;
  for (const auto& [key, value] : metadata) {
    aws_metadata[key.c_str()] = value.c_str();
  }
  return aws_metadata;
}

}  // namespace

// =============================================================================
// S3ObjectStore Implementation
// =============================================================================

class S3ObjectStore::Impl {
public:
  S3StoreConfig config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // The client must be destroyed before release() may shut the SDK down
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      "HoistS3Retry", static_cast<long>(config.max_sdk_retries)
    );

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Path-style addressing for custom endpoints (MinIO), virtual-hosted for AWS
    bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials, client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

S3ObjectStore::S3ObjectStore(const S3StoreConfig& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  HOIST_LOG_DEBUG("S3 object store ready" << kv("endpoint", impl_->config.endpoint_url)
                                          << kv("region", impl_->config.region));
}

S3ObjectStore::~S3ObjectStore() = default;

StoreResult<std::string> S3ObjectStore::putObject(
  const ObjectKey& object, const std::string& body, const ObjectAttributes& attributes
) {
  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(object.bucket);
  request.SetKey(object.key);
  request.SetContentType(attributes.content_type);
  request.SetMetadata(toAwsMetadata(attributes.metadata));
  request.SetContentLength(static_cast<long long>(body.size()));
  request.SetBody(makeBody(body));

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    return StoreResult<std::string>::Fail(toStoreError(outcome.GetError()));
  }
  return StoreResult<std::string>::Ok(stripQuotes(outcome.GetResult().GetETag()));
}

StoreResult<std::string> S3ObjectStore::createMultipartUpload(
  const ObjectKey& object, const ObjectAttributes& attributes
) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(object.bucket);
  request.SetKey(object.key);
  request.SetContentType(attributes.content_type);
  request.SetMetadata(toAwsMetadata(attributes.metadata));

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return StoreResult<std::string>::Fail(toStoreError(outcome.GetError()));
  }
  return StoreResult<std::string>::Ok(std::string(outcome.GetResult().GetUploadId().c_str()));
}

StoreResult<std::string> S3ObjectStore::uploadPart(
  const ObjectKey& object, const std::string& upload_id, int part_number, const std::string& body
) {
  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(object.bucket);
  request.SetKey(object.key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(part_number);
  request.SetContentLength(static_cast<long long>(body.size()));
  request.SetBody(makeBody(body));

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return StoreResult<std::string>::Fail(toStoreError(outcome.GetError()));
  }
  return StoreResult<std::string>::Ok(stripQuotes(outcome.GetResult().GetETag()));
}

StoreResult<std::string> S3ObjectStore::completeMultipartUpload(
  const ObjectKey& object, const std::string& upload_id, const std::vector<CompletedPart>& parts
) {
  Aws::S3::Model::CompletedMultipartUpload completed;
  for (const auto& part : parts) {
    completed.AddParts(
      Aws::S3::Model::CompletedPart().WithPartNumber(part.part_number).WithETag(part.etag)
    );
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(object.bucket);
  request.SetKey(object.key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(completed);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return StoreResult<std::string>::Fail(toStoreError(outcome.GetError()));
  }
  return StoreResult<std::string>::Ok(stripQuotes(outcome.GetResult().GetETag()));
}

StoreStatus S3ObjectStore::abortMultipartUpload(
  const ObjectKey& object, const std::string& upload_id
) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(object.bucket);
  request.SetKey(object.key);
  request.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return StoreStatus::Fail(toStoreError(outcome.GetError()));
  }
  return StoreStatus::Ok(true);
}

StoreResult<std::vector<CompletedPart>> S3ObjectStore::listParts(
  const ObjectKey& object, const std::string& upload_id
) {
  using Result = StoreResult<std::vector<CompletedPart>>;
  std::vector<CompletedPart> parts;

  Aws::S3::Model::ListPartsRequest request;
  request.SetBucket(object.bucket);
  request.SetKey(object.key);
  request.SetUploadId(upload_id);

  while (true) {
    auto outcome = impl_->client->ListParts(request);
    if (!outcome.IsSuccess()) {
      return Result::Fail(toStoreError(outcome.GetError()));
    }

    const auto& result = outcome.GetResult();
    for (const auto& part : result.GetParts()) {
      parts.push_back(CompletedPart{
        part.GetPartNumber(), stripQuotes(part.GetETag()), static_cast<uint64_t>(part.GetSize())});
    }

    if (!result.GetIsTruncated()) {
      break;
    }
    request.SetPartNumberMarker(result.GetNextPartNumberMarker());
  }

  return Result::Ok(std::move(parts));
}

StoreResult<std::vector<MultipartUploadSummary>> S3ObjectStore::listMultipartUploads(
  const std::string& bucket, const std::string& prefix
) {
  using Result = StoreResult<std::vector<MultipartUploadSummary>>;
  std::vector<MultipartUploadSummary> uploads;

  Aws::S3::Model::ListMultipartUploadsRequest request;
  request.SetBucket(bucket);
  if (!prefix.empty()) {
    request.SetPrefix(prefix);
  }

  while (true) {
    auto outcome = impl_->client->ListMultipartUploads(request);
    if (!outcome.IsSuccess()) {
      return Result::Fail(toStoreError(outcome.GetError()));
    }

    const auto& result = outcome.GetResult();
    for (const auto& upload : result.GetUploads()) {
      uploads.push_back(MultipartUploadSummary{
        std::string(upload.GetKey().c_str()), std::string(upload.GetUploadId().c_str())});
    }

    if (!result.GetIsTruncated()) {
      break;
    }
    request.SetKeyMarker(result.GetNextKeyMarker());
    request.SetUploadIdMarker(result.GetNextUploadIdMarker());
  }

  return Result::Ok(std::move(uploads));
}

StoreResult<ObjectInfo> S3ObjectStore::headObject(const ObjectKey& object) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(object.bucket);
  request.SetKey(object.key);

  auto outcome = impl_->client->HeadObject(request);
  if (!outcome.IsSuccess()) {
    return StoreResult<ObjectInfo>::Fail(toStoreError(outcome.GetError()));
  }

  const auto& result = outcome.GetResult();
  ObjectInfo info;
  info.size_bytes = static_cast<uint64_t>(result.GetContentLength());
  info.etag = stripQuotes(result.GetETag());
  info.content_type = std::string(result.GetContentType().c_str());
  for (const auto& [key, value] : result.GetMetadata()) {
    info.metadata[std::string(key.c_str())] = std::string(value.c_str());
  }
  return StoreResult<ObjectInfo>::Ok(std::move(info));
}

const std::string& S3ObjectStore::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace transfer
}  // namespace hoist
