// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_WAITER_HPP
#define HOIST_WAITER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "object_store.hpp"
#include "retry_handler.hpp"

namespace hoist {
namespace transfer {

/**
 * Decision an acceptor makes for one poll result
 */
enum class WaiterState { SUCCESS, RETRY, FAILURE };

/**
 * Matches a poll result (response or store error) and maps it to a WaiterState
 */
template<typename T>
struct WaiterAcceptor {
  WaiterState state = WaiterState::RETRY;
  std::function<bool(const T&)> on_response;
  std::function<bool(const StoreError&)> on_error;

  static WaiterAcceptor successOnResponse(std::function<bool(const T&)> predicate) {
    return {WaiterState::SUCCESS, std::move(predicate), nullptr};
  }

  static WaiterAcceptor successOnError(std::function<bool(const StoreError&)> predicate) {
    return {WaiterState::SUCCESS, nullptr, std::move(predicate)};
  }

  static WaiterAcceptor retryOnResponse(std::function<bool(const T&)> predicate) {
    return {WaiterState::RETRY, std::move(predicate), nullptr};
  }

  static WaiterAcceptor retryOnError(std::function<bool(const StoreError&)> predicate) {
    return {WaiterState::RETRY, nullptr, std::move(predicate)};
  }

  static WaiterAcceptor failureOnError(std::function<bool(const StoreError&)> predicate) {
    return {WaiterState::FAILURE, nullptr, std::move(predicate)};
  }

  std::optional<WaiterState> match(const StoreResult<T>& result) const {
    if (result.success && on_response && on_response(result.value)) {
      return state;
    }
    if (!result.success && on_error && on_error(result.error)) {
      return state;
    }
    return std::nullopt;
  }
};

/**
 * Time source used by Waiter
 *
 * Injected so tests can drive timeouts without sleeping.
 */
class WaiterClock {
public:
  virtual ~WaiterClock() = default;
  virtual std::chrono::steady_clock::time_point now() = 0;
  virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SteadyWaiterClock : public WaiterClock {
public:
  std::chrono::steady_clock::time_point now() override {
    return std::chrono::steady_clock::now();
  }

  void sleepFor(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }
};

/**
 * Bounds on a Waiter poll loop
 *
 * backoff.max_retries is not consulted; max_attempts bounds the loop.
 */
struct WaiterConfig {
  int max_attempts = 10;
  std::chrono::milliseconds wait_timeout{60000};
  RetryConfig backoff = fixedDelayRetryConfig(std::chrono::milliseconds(100), 0);
};

enum class WaiterStatus {
  MATCHED,             // A SUCCESS acceptor matched
  FAILED,              // A FAILURE acceptor matched, or a non-retryable error was unmatched
  TIMED_OUT,           // The next delay would exceed wait_timeout
  ATTEMPTS_EXHAUSTED,  // max_attempts polls without a terminal match
  CANCELLED,           // The caller stopped waiting
};

inline std::string waiterStatusToString(WaiterStatus status) {
  switch (status) {
    case WaiterStatus::MATCHED:
      return "matched";
    case WaiterStatus::FAILED:
      return "failed";
    case WaiterStatus::TIMED_OUT:
      return "timed_out";
    case WaiterStatus::ATTEMPTS_EXHAUSTED:
      return "attempts_exhausted";
    case WaiterStatus::CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

template<typename T>
struct WaiterResponse {
  WaiterStatus status = WaiterStatus::FAILED;
  StoreResult<T> last_result;  // Result of the final poll
  int attempts = 0;

  bool matched() const {
    return status == WaiterStatus::MATCHED;
  }
};

/**
 * Bounded poll-until-condition
 *
 * Polls until an acceptor reports SUCCESS or FAILURE, or the attempt or time
 * budget runs out. The loop always ends with a definite WaiterStatus.
 *
 * Unmatched results: a successful response is retried; an error is retried
 * only when it is marked retryable.
 */
template<typename T>
class Waiter {
public:
  Waiter(
    WaiterConfig config, std::vector<WaiterAcceptor<T>> acceptors,
    std::shared_ptr<WaiterClock> clock = std::make_shared<SteadyWaiterClock>()
  )
      : config_(std::move(config))
      , acceptors_(std::move(acceptors))
      , clock_(std::move(clock))
      , backoff_(config_.backoff) {}

  /**
   * @param cancelled Checked before every poll; returning true ends the loop
   *        with CANCELLED (last_result is then the previous poll's result)
   */
  WaiterResponse<T> run(
    const std::function<StoreResult<T>()>& poll,
    const std::function<bool()>& cancelled = nullptr
  ) const {
    WaiterResponse<T> response;
    const auto started = clock_->now();

    while (true) {
      if (cancelled && cancelled()) {
        response.status = WaiterStatus::CANCELLED;
        return response;
      }
      ++response.attempts;
      response.last_result = poll();

      WaiterState state = classify(response.last_result);
      if (state == WaiterState::SUCCESS) {
        response.status = WaiterStatus::MATCHED;
        return response;
      }
      if (state == WaiterState::FAILURE) {
        response.status = WaiterStatus::FAILED;
        return response;
      }
      if (response.attempts >= config_.max_attempts) {
        response.status = WaiterStatus::ATTEMPTS_EXHAUSTED;
        return response;
      }

      auto delay = backoff_.getDelay(response.attempts - 1);
      if (clock_->now() - started + delay > config_.wait_timeout) {
        response.status = WaiterStatus::TIMED_OUT;
        return response;
      }
      clock_->sleepFor(delay);
    }
  }

  const WaiterConfig& config() const {
    return config_;
  }

private:
  WaiterState classify(const StoreResult<T>& result) const {
    for (const auto& acceptor : acceptors_) {
      if (auto state = acceptor.match(result)) {
        return *state;
      }
    }
    if (result.success) {
      return WaiterState::RETRY;
    }
    return result.error.retryable ? WaiterState::RETRY : WaiterState::FAILURE;
  }

  WaiterConfig config_;
  std::vector<WaiterAcceptor<T>> acceptors_;
  std::shared_ptr<WaiterClock> clock_;
  RetryHandler backoff_;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_WAITER_HPP
