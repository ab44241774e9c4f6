// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_manager.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

#include "file_signature.hpp"
#include "transfer_executor.hpp"
#include "transfer_impl.hpp"
#include "upload_operation.hpp"

#define HOIST_LOG_COMPONENT "transfer_manager"
#include <hoist_log_macros.hpp>

namespace hoist {
namespace transfer {

using hoist::logging::kv;

namespace {

// S3 limit on parts per multipart upload
constexpr uint64_t kMaxParts = 10000;

std::atomic<uint64_t> g_transfer_counter{0};

}  // namespace

// =============================================================================
// TransferManager::Impl
// =============================================================================
// Tasks capture the raw Impl pointer. This is safe because the destructor joins
// every worker before Impl goes away.

class TransferManager::Impl {
public:
  Impl(
    TransferConfig cfg, std::shared_ptr<IObjectStore> object_store,
    std::shared_ptr<IFileSystem> fs, std::shared_ptr<WaiterClock> waiter_clock
  )
      : config(std::move(cfg))
      , store(std::move(object_store))
      , filesystem(std::move(fs))
      , clock(std::move(waiter_clock))
      , retry(config.retry)
      , executor(config.max_concurrency, config.name) {}

  TransferConfig config;
  std::shared_ptr<IObjectStore> store;
  std::shared_ptr<IFileSystem> filesystem;
  std::shared_ptr<WaiterClock> clock;
  RetryHandler retry;
  TransferExecutor executor;

  mutable std::mutex operations_mutex;
  std::vector<std::weak_ptr<UploadOperation>> operations;
  std::atomic<bool> closed{false};

  std::string nextTransferId() const {
    return config.name + "-" + std::to_string(++g_transfer_counter);
  }

  void track(const std::shared_ptr<UploadOperation>& op) {
    std::lock_guard<std::mutex> lock(operations_mutex);
    operations.erase(
      std::remove_if(
        operations.begin(), operations.end(),
        [](const std::weak_ptr<UploadOperation>& weak) {
          return weak.expired();
        }
      ),
      operations.end()
    );
    operations.push_back(op);
  }

  void dispatch(const std::shared_ptr<UploadOperation>& op, TransferExecutor::Task task) {
    if (closed.load() || !executor.submit(std::move(task))) {
      op->close(result_codes::kTransferManagerClosed, "Transfer manager was shut down");
    }
  }

  void shutdown();

  void runUpload(const std::shared_ptr<UploadOperation>& op);
  void runResume(const std::shared_ptr<UploadOperation>& op, const ResumableUpload& token);

  void startFresh(const std::shared_ptr<UploadOperation>& op, const FileSignature& signature);
  void putSingle(const std::shared_ptr<UploadOperation>& op, uint64_t length);
  void startMultipart(const std::shared_ptr<UploadOperation>& op, uint64_t length);
  void continueMultipart(
    const std::shared_ptr<UploadOperation>& op, const ResumableUpload& token,
    const std::vector<CompletedPart>& remote_parts
  );
  void dispatchParts(
    const std::shared_ptr<UploadOperation>& op, const std::string& upload_id, uint64_t part_size,
    uint64_t length, const std::vector<int>& part_numbers
  );
  void uploadPart(
    const std::shared_ptr<UploadOperation>& op, const std::string& upload_id, int part_number,
    uint64_t part_size, uint64_t length
  );
  void completeMultipart(const std::shared_ptr<UploadOperation>& op, const std::string& upload_id);
  void failMultipart(
    const std::shared_ptr<UploadOperation>& op, const std::string& upload_id,
    const StoreError& error
  );
  void abortQuietly(const ObjectKey& object, const std::string& upload_id, const char* reason);

  /**
   * Run a store request, retrying transient errors with backoff while the
   * transfer is still in progress
   */
  template<typename T, typename Fn>
  StoreResult<T> callWithRetry(
    const std::shared_ptr<UploadOperation>& op, const char* operation, Fn&& fn
  ) {
    int attempt = 0;
    while (true) {
      StoreResult<T> result = fn();
      if (result.success || !retry.shouldRetry(result.error, attempt) || !op->isActive()) {
        return result;
      }

      auto delay = retry.getDelay(attempt);
      HOIST_LOG_WARN("Retrying store request" << kv("operation", operation)
                                              << kv("code", result.error.code)
                                              << kv("attempt", attempt + 1)
                                              << kv("delay_ms", delay.count()));
      std::this_thread::sleep_for(delay);
      ++attempt;
    }
  }
};

void TransferManager::Impl::shutdown() {
  if (closed.exchange(true)) {
    return;
  }

  std::vector<std::shared_ptr<UploadOperation>> live;
  {
    std::lock_guard<std::mutex> lock(operations_mutex);
    for (const auto& weak : operations) {
      if (auto op = weak.lock()) {
        live.push_back(std::move(op));
      }
    }
    operations.clear();
  }

  std::vector<std::shared_ptr<UploadOperation>> closed_running;
  for (const auto& op : live) {
    bool was_running = op->isActive();
    op->close(result_codes::kTransferManagerClosed, "Transfer manager was shut down");
    if (was_running) {
      closed_running.push_back(op);
    }
  }

  executor.shutdown();

  // Workers are joined; no multipart upload can be registered any more
  if (config.abort_on_failure) {
    for (const auto& op : closed_running) {
      if (op->state() != TransferState::FAILED) {
        continue;
      }
      if (auto upload_id = op->multipartUploadId()) {
        abortQuietly(op->request().object(), *upload_id, "manager shutdown");
      }
    }
  }

  HOIST_LOG_INFO("Transfer manager stopped" << kv("name", config.name)
                                            << kv("closed_transfers", closed_running.size()));
}

void TransferManager::Impl::runUpload(const std::shared_ptr<UploadOperation>& op) {
  HOIST_LOG_SCOPED_TRANSFER(op->transferId(), op->request().object().str());
  if (!op->isActive()) {
    return;
  }
  op->notifyInitiated();
  startFresh(op, op->signature());
}

void TransferManager::Impl::startFresh(
  const std::shared_ptr<UploadOperation>& op, const FileSignature& signature
) {
  const uint64_t length = signature.size_bytes;
  op->progress().setTotalBytes(length);

  if (length > 0 && length >= config.multipart_threshold_bytes) {
    startMultipart(op, length);
  } else {
    putSingle(op, length);
  }
}

void TransferManager::Impl::putSingle(const std::shared_ptr<UploadOperation>& op, uint64_t length) {
  const auto& request = op->request();

  std::string body;
  if (!filesystem->read_range(request.source, 0, length, body)) {
    op->fail(result_codes::kFileReadError, "Cannot read source file: " + request.source);
    return;
  }

  auto result = callWithRetry<std::string>(op, "PutObject", [&]() {
    return store->putObject(request.object(), body, request.attributes());
  });

  if (!result.success) {
    HOIST_LOG_ERROR("PutObject failed" << kv("code", result.error.code)
                                       << kv("error", result.error.message));
    op->fail(result.error.code, result.error.message);
    return;
  }

  op->progress().addTransferredBytes(length);
  op->notifyBytesTransferred();
  if (op->complete(result.value)) {
    HOIST_LOG_INFO("Upload complete" << kv("strategy", "single") << kv("bytes", length));
  }
}

void TransferManager::Impl::startMultipart(
  const std::shared_ptr<UploadOperation>& op, uint64_t length
) {
  const auto& request = op->request();
  const uint64_t part_size = TransferManager::computePartSize(length, config.part_size_bytes);
  const uint32_t total_parts = TransferManager::computePartCount(length, part_size);

  if (!op->isActive()) {
    return;
  }

  auto created = callWithRetry<std::string>(op, "CreateMultipartUpload", [&]() {
    return store->createMultipartUpload(request.object(), request.attributes());
  });
  if (!created.success) {
    HOIST_LOG_ERROR("CreateMultipartUpload failed" << kv("code", created.error.code)
                                                   << kv("error", created.error.message));
    op->fail(created.error.code, created.error.message);
    return;
  }

  const std::string& upload_id = created.value;
  if (!op->recordMultipartUpload(upload_id, part_size, total_parts, {})) {
    // Paused or closed before the id could be recorded; the token does not
    // reference this upload, so nothing would ever clean it up
    abortQuietly(request.object(), upload_id, "transfer stopped before registration");
    return;
  }

  HOIST_LOG_INFO("Multipart upload created" << kv("upload_id", upload_id) << kv("bytes", length)
                                            << kv("part_size", part_size)
                                            << kv("parts", total_parts));

  std::vector<int> part_numbers;
  part_numbers.reserve(total_parts);
  for (uint32_t n = 1; n <= total_parts; ++n) {
    part_numbers.push_back(static_cast<int>(n));
  }
  dispatchParts(op, upload_id, part_size, length, part_numbers);
}

void TransferManager::Impl::dispatchParts(
  const std::shared_ptr<UploadOperation>& op, const std::string& upload_id, uint64_t part_size,
  uint64_t length, const std::vector<int>& part_numbers
) {
  if (part_numbers.empty()) {
    completeMultipart(op, upload_id);
    return;
  }

  for (int part_number : part_numbers) {
    dispatch(op, [this, op, upload_id, part_number, part_size, length]() {
      uploadPart(op, upload_id, part_number, part_size, length);
    });
  }
}

void TransferManager::Impl::uploadPart(
  const std::shared_ptr<UploadOperation>& op, const std::string& upload_id, int part_number,
  uint64_t part_size, uint64_t length
) {
  HOIST_LOG_SCOPED_TRANSFER(op->transferId(), op->request().object().str());
  if (!op->isActive()) {
    return;
  }

  const auto& request = op->request();
  const uint64_t offset = static_cast<uint64_t>(part_number - 1) * part_size;
  const uint64_t size = std::min(part_size, length - offset);

  std::string body;
  if (!filesystem->read_range(request.source, offset, size, body)) {
    failMultipart(
      op, upload_id,
      StoreError{result_codes::kFileReadError, "Cannot read source file: " + request.source, false}
    );
    return;
  }

  auto result = callWithRetry<std::string>(op, "UploadPart", [&]() {
    return store->uploadPart(request.object(), upload_id, part_number, body);
  });

  if (!op->isActive()) {
    HOIST_LOG_DEBUG("Dropping part result of stopped transfer" << kv("part", part_number));
    return;
  }

  if (!result.success) {
    HOIST_LOG_ERROR("UploadPart failed" << kv("part", part_number)
                                        << kv("code", result.error.code)
                                        << kv("error", result.error.message));
    failMultipart(op, upload_id, result.error);
    return;
  }

  auto outcome = op->recordPart(CompletedPart{part_number, result.value, size});
  if (outcome == UploadOperation::PartOutcome::DROPPED) {
    return;
  }

  HOIST_LOG_DEBUG("Part uploaded" << kv("part", part_number) << kv("bytes", size));
  op->notifyBytesTransferred();

  if (outcome == UploadOperation::PartOutcome::RECORDED_LAST) {
    completeMultipart(op, upload_id);
  }
}

void TransferManager::Impl::completeMultipart(
  const std::shared_ptr<UploadOperation>& op, const std::string& upload_id
) {
  if (!op->beginCompleting()) {
    return;
  }

  const auto& request = op->request();
  auto parts = op->completedParts();

  auto result = callWithRetry<std::string>(op, "CompleteMultipartUpload", [&]() {
    return store->completeMultipartUpload(request.object(), upload_id, parts);
  });

  if (!result.success) {
    HOIST_LOG_ERROR("CompleteMultipartUpload failed" << kv("upload_id", upload_id)
                                                     << kv("code", result.error.code)
                                                     << kv("error", result.error.message));
    failMultipart(op, upload_id, result.error);
    return;
  }

  // Neither pause() nor close() can move a completing transfer
  op->complete(result.value);
  HOIST_LOG_INFO("Upload complete" << kv("strategy", "multipart") << kv("upload_id", upload_id)
                                   << kv("parts", parts.size())
                                   << kv("bytes", op->progressSnapshot().transferred_bytes));
}

void TransferManager::Impl::failMultipart(
  const std::shared_ptr<UploadOperation>& op, const std::string& upload_id,
  const StoreError& error
) {
  if (!op->fail(error.code, error.message)) {
    return;
  }
  if (config.abort_on_failure) {
    abortQuietly(op->request().object(), upload_id, "transfer failed");
  }
}

void TransferManager::Impl::abortQuietly(
  const ObjectKey& object, const std::string& upload_id, const char* reason
) {
  auto result = store->abortMultipartUpload(object, upload_id);
  if (result.success) {
    HOIST_LOG_INFO("Multipart upload aborted" << kv("upload_id", upload_id)
                                              << kv("reason", reason));
  } else if (result.error.is(error_codes::kNoSuchUpload)) {
    HOIST_LOG_DEBUG("Multipart upload already gone" << kv("upload_id", upload_id));
  } else {
    HOIST_LOG_WARN("AbortMultipartUpload failed" << kv("upload_id", upload_id)
                                                 << kv("code", result.error.code)
                                                 << kv("error", result.error.message));
  }
}

void TransferManager::Impl::runResume(
  const std::shared_ptr<UploadOperation>& op, const ResumableUpload& token
) {
  HOIST_LOG_SCOPED_TRANSFER(op->transferId(), op->request().object().str());

  std::string error_msg;
  if (!op->start(error_msg)) {
    HOIST_LOG_DEBUG("Resume not started" << kv("error", error_msg));
    return;
  }
  op->notifyInitiated();

  const auto& request = op->request();
  auto current = captureFileSignature(request.source, *filesystem);
  if (!current) {
    op->fail(result_codes::kFileNotFound, "Source file not found: " + request.source);
    return;
  }

  if (!token.multipart_upload_id) {
    HOIST_LOG_INFO("Resuming without multipart state, restarting" << kv("token", token.describe()));
    op->resetForRestart(*current);
    startFresh(op, *current);
    return;
  }

  const std::string& upload_id = *token.multipart_upload_id;
  const FileSignature recorded{token.file_length, token.file_last_modified_ns};
  if (*current != recorded) {
    HOIST_LOG_INFO("Source changed since pause, restarting"
                   << kv("upload_id", upload_id) << kv("old_size", recorded.size_bytes)
                   << kv("new_size", current->size_bytes));
    abortQuietly(request.object(), upload_id, "source changed");
    if (op->resetForRestart(*current)) {
      startFresh(op, *current);
    }
    return;
  }

  Waiter<std::vector<CompletedPart>> waiter(
    config.resume_check,
    {WaiterAcceptor<std::vector<CompletedPart>>::successOnResponse(
       [](const std::vector<CompletedPart>&) {
         return true;
       }
     ),
     WaiterAcceptor<std::vector<CompletedPart>>::successOnError([](const StoreError& error) {
       return error.is(error_codes::kNoSuchUpload);
     })},
    clock
  );

  auto response = waiter.run(
    [&]() {
      return store->listParts(request.object(), upload_id);
    },
    [&op]() {
      return !op->isActive();
    }
  );

  if (response.status == WaiterStatus::CANCELLED) {
    HOIST_LOG_DEBUG("Existence check stopped" << kv("upload_id", upload_id)
                                              << kv("attempts", response.attempts));
    return;
  }

  if (!response.matched()) {
    HOIST_LOG_ERROR("Existence check of multipart upload failed"
                    << kv("upload_id", upload_id)
                    << kv("status", waiterStatusToString(response.status))
                    << kv("attempts", response.attempts));
    if (response.status == WaiterStatus::FAILED) {
      op->fail(response.last_result.error.code, response.last_result.error.message);
    } else {
      op->fail(
        result_codes::kResumeCheckTimeout,
        "Could not confirm multipart upload " + upload_id + " after " +
          std::to_string(response.attempts) + " attempts"
      );
    }
    return;
  }

  if (!response.last_result.success) {
    HOIST_LOG_INFO("Multipart upload no longer exists, restarting" << kv("upload_id", upload_id));
    if (op->resetForRestart(*current)) {
      startFresh(op, *current);
    }
    return;
  }

  continueMultipart(op, token, response.last_result.value);
}

void TransferManager::Impl::continueMultipart(
  const std::shared_ptr<UploadOperation>& op, const ResumableUpload& token,
  const std::vector<CompletedPart>& remote_parts
) {
  const std::string& upload_id = *token.multipart_upload_id;
  const uint64_t length = token.file_length;
  const uint64_t part_size = *token.part_size_bytes;
  const uint32_t total_parts = *token.total_parts;

  op->progress().setTotalBytes(length);
  if (!op->recordMultipartUpload(upload_id, part_size, total_parts, remote_parts)) {
    return;
  }

  std::set<int> done;
  for (const auto& part : remote_parts) {
    done.insert(part.part_number);
  }
  std::vector<int> missing;
  for (uint32_t n = 1; n <= total_parts; ++n) {
    if (done.count(static_cast<int>(n)) == 0) {
      missing.push_back(static_cast<int>(n));
    }
  }

  HOIST_LOG_INFO("Continuing multipart upload" << kv("upload_id", upload_id)
                                               << kv("parts_done", total_parts - missing.size())
                                               << kv("parts_missing", missing.size()));
  if (!missing.empty()) {
    op->notifyBytesTransferred();
  }
  dispatchParts(op, upload_id, part_size, length, missing);
}

// =============================================================================
// TransferManager
// =============================================================================

TransferManager::TransferManager(
  TransferConfig config, std::shared_ptr<IObjectStore> store,
  std::shared_ptr<IFileSystem> filesystem, std::shared_ptr<WaiterClock> clock
) {
  if (!store) {
    throw std::invalid_argument("TransferManager requires an object store");
  }
  if (!filesystem) {
    filesystem = std::make_shared<FileSystemImpl>();
  }
  if (!clock) {
    clock = std::make_shared<SteadyWaiterClock>();
  }
  impl_ = std::make_unique<Impl>(
    std::move(config), std::move(store), std::move(filesystem), std::move(clock)
  );

  HOIST_LOG_INFO("Transfer manager started"
                 << kv("name", impl_->config.name)
                 << kv("multipart_threshold", impl_->config.multipart_threshold_bytes)
                 << kv("part_size", impl_->config.part_size_bytes)
                 << kv("concurrency", impl_->executor.workerCount()));
}

TransferManager::~TransferManager() {
  impl_->shutdown();
}

std::unique_ptr<FileUpload> TransferManager::uploadFile(const UploadFileRequest& request) {
  const std::string transfer_id = impl_->nextTransferId();
  auto signature = captureFileSignature(request.source, *impl_->filesystem);

  if (!signature) {
    auto op = std::make_shared<UploadOperation>(transfer_id, request, FileSignature{});
    HOIST_LOG_ERROR("Source file not found" << kv("transfer_id", transfer_id)
                                            << kv("source", request.source));
    op->fail(result_codes::kFileNotFound, "Source file not found: " + request.source);
    return std::make_unique<FileUpload>(op);
  }

  auto op = std::make_shared<UploadOperation>(transfer_id, request, *signature);
  std::string error_msg;
  if (!op->start(error_msg)) {
    // LCOV_EXCL_START - a new operation can always start
    HOIST_LOG_ERROR("Upload could not start" << kv("transfer_id", transfer_id)
                                             << kv("error", error_msg));
    op->fail(result_codes::kTransferManagerClosed, error_msg);
    return std::make_unique<FileUpload>(op);
    // LCOV_EXCL_STOP
  }
  impl_->track(op);

  HOIST_LOG_DEBUG("Upload submitted" << kv("transfer_id", transfer_id)
                                     << kv("object", request.object().str())
                                     << kv("bytes", signature->size_bytes));

  Impl* impl = impl_.get();
  impl_->dispatch(op, [impl, op]() {
    impl->runUpload(op);
  });
  return std::make_unique<FileUpload>(op);
}

std::unique_ptr<FileUpload> TransferManager::resumeUploadFile(
  const ResumableUpload& token, const std::vector<std::shared_ptr<TransferListener>>& listeners
) {
  const std::string transfer_id = impl_->nextTransferId();

  ResumableUpload resumed = token;
  resumed.request.listeners = listeners;

  if (!token.isConsistent() || token.request.bucket.empty() || token.request.key.empty()) {
    auto op = std::make_shared<UploadOperation>(
      transfer_id, resumed.request,
      FileSignature{token.file_length, token.file_last_modified_ns}
    );
    HOIST_LOG_ERROR("Invalid resume token" << kv("transfer_id", transfer_id)
                                           << kv("token", token.describe()));
    op->fail(result_codes::kInvalidResumeToken, "Inconsistent resume token: " + token.describe());
    return std::make_unique<FileUpload>(op);
  }

  auto op = std::make_shared<UploadOperation>(transfer_id, resumed);
  impl_->track(op);

  HOIST_LOG_DEBUG("Resume submitted" << kv("transfer_id", transfer_id)
                                     << kv("token", token.describe()));

  Impl* impl = impl_.get();
  impl_->dispatch(op, [impl, op, resumed]() {
    impl->runResume(op, resumed);
  });
  return std::make_unique<FileUpload>(op);
}

size_t TransferManager::activeTransfers() const {
  std::lock_guard<std::mutex> lock(impl_->operations_mutex);
  size_t active = 0;
  for (const auto& weak : impl_->operations) {
    auto op = weak.lock();
    if (op && op->isActive()) {
      ++active;
    }
  }
  return active;
}

const TransferConfig& TransferManager::config() const {
  return impl_->config;
}

uint64_t TransferManager::computePartSize(uint64_t file_length, uint64_t configured_part_size) {
  const uint64_t minimum_for_limit = (file_length + kMaxParts - 1) / kMaxParts;
  return std::max<uint64_t>({configured_part_size, minimum_for_limit, 1});
}

uint32_t TransferManager::computePartCount(uint64_t file_length, uint64_t part_size) {
  if (file_length == 0 || part_size == 0) {
    return 0;
  }
  return static_cast<uint32_t>((file_length + part_size - 1) / part_size);
}

}  // namespace transfer
}  // namespace hoist
