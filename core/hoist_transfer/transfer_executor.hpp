// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_TRANSFER_EXECUTOR_HPP
#define HOIST_TRANSFER_EXECUTOR_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hoist {
namespace transfer {

/**
 * Fixed pool of worker threads draining a FIFO task queue
 *
 * Tasks may submit further tasks. shutdown() drops queued tasks and joins the
 * workers after their current task returns.
 */
class TransferExecutor {
public:
  using Task = std::function<void()>;

  /**
   * @param num_workers Number of worker threads (at least 1)
   * @param name Used in log messages
   */
  explicit TransferExecutor(size_t num_workers, std::string name = "transfer");
  ~TransferExecutor();

  // Non-copyable, non-movable
  TransferExecutor(const TransferExecutor&) = delete;
  TransferExecutor& operator=(const TransferExecutor&) = delete;
  TransferExecutor(TransferExecutor&&) = delete;
  TransferExecutor& operator=(TransferExecutor&&) = delete;

  /**
   * Queue a task
   * @return false if the executor was shut down
   */
  bool submit(Task task);

  /**
   * Stop accepting tasks, drop the queue and join the workers
   *
   * Must not be called from a worker thread. Idempotent.
   *
   * @return Number of queued tasks that never ran
   */
  size_t shutdown();

  bool isRunning() const;

  // Tasks waiting in the queue
  size_t pending() const;

  // Tasks currently executing
  size_t active() const;

  size_t workerCount() const {
    return workers_.size();
  }

private:
  void workerLoop(size_t worker_id);

  std::string name_;
  std::vector<std::thread> workers_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> queue_;
  bool shutdown_ = false;
  std::atomic<size_t> active_{0};
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_TRANSFER_EXECUTOR_HPP
