// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_executor.hpp"

#include <exception>

#define HOIST_LOG_COMPONENT "transfer_executor"
#include <hoist_log_macros.hpp>

namespace hoist {
namespace transfer {

using hoist::logging::kv;

TransferExecutor::TransferExecutor(size_t num_workers, std::string name)
    : name_(std::move(name)) {
  if (num_workers == 0) {
    num_workers = 1;
  }
  workers_.reserve(num_workers);
  for (size_t i = 0; i < num_workers; ++i) {
    workers_.emplace_back(&TransferExecutor::workerLoop, this, i);
  }
  HOIST_LOG_DEBUG("Executor started" << kv("name", name_) << kv("workers", num_workers));
}

TransferExecutor::~TransferExecutor() {
  shutdown();
}

bool TransferExecutor::submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return false;
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

size_t TransferExecutor::shutdown() {
  size_t dropped = 0;
  bool first_call = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    first_call = !shutdown_;
    shutdown_ = true;
    dropped = queue_.size();
    queue_.clear();
  }
  cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  if (dropped > 0) {
    HOIST_LOG_INFO("Executor stopped with queued tasks" << kv("name", name_)
                                                        << kv("dropped", dropped));
  } else if (first_call) {
    HOIST_LOG_DEBUG("Executor stopped" << kv("name", name_));
  }
  return dropped;
}

bool TransferExecutor::isRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !shutdown_;
}

size_t TransferExecutor::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

size_t TransferExecutor::active() const {
  return active_.load();
}

void TransferExecutor::workerLoop(size_t worker_id) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] {
        return shutdown_ || !queue_.empty();
      });
      if (shutdown_) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    try {
      task();
    } catch (const std::exception& e) {
      HOIST_LOG_ERROR("Task threw" << kv("name", name_) << kv("worker", worker_id)
                                   << kv("error", e.what()));
    }
    --active_;
  }
}

}  // namespace transfer
}  // namespace hoist
