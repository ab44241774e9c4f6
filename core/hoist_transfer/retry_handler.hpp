// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_RETRY_HANDLER_HPP
#define HOIST_RETRY_HANDLER_HPP

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

#include "object_store.hpp"

namespace hoist {
namespace transfer {

/**
 * Backoff for store requests that fail with a transient error
 *
 * A fixed delay is expressed as exponential_base = 1.0 with jitter disabled.
 */
struct RetryConfig {
  int max_retries = 3;                           // Retries per store request
  std::chrono::milliseconds initial_delay{200};  // Delay before the first retry
  std::chrono::milliseconds max_delay{20000};    // Backoff cap
  double exponential_base = 2.0;
  bool jitter = true;
  double jitter_factor = 0.5;  // Jitter range: [1-factor, 1+factor]
};

/**
 * Fixed-delay backoff for polling waiters
 */
inline RetryConfig fixedDelayRetryConfig(std::chrono::milliseconds delay, int max_retries) {
  RetryConfig config;
  config.max_retries = max_retries;
  config.initial_delay = delay;
  config.max_delay = delay;
  config.exponential_base = 1.0;
  config.jitter = false;
  return config;
}

/**
 * initial_delay * base^attempt, capped at max_delay, scaled by @p jitter_scale
 * and never below 1 ms
 *
 * @param attempt Retries already made (0 before the first retry)
 * @param jitter_scale Multiplier drawn from [1 - jitter_factor, 1 + jitter_factor]
 */
inline std::chrono::milliseconds backoffDelay(
  const RetryConfig& config, int attempt, double jitter_scale = 1.0
) {
  double delay_ms = static_cast<double>(config.initial_delay.count()) *
                    std::pow(config.exponential_base, static_cast<double>(attempt));
  delay_ms = std::min(delay_ms, static_cast<double>(config.max_delay.count()));
  delay_ms = std::max(delay_ms * jitter_scale, 1.0);
  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

/**
 * Decides whether a failed store request is sent again and how long to wait
 *
 * Part workers share one handler per TransferManager; the Waiter owns its own
 * for resume existence checks. Thread-safe.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config)
      , rng_(std::random_device{}()) {}

  std::chrono::milliseconds getDelay(int attempt) const {
    if (!config_.jitter) {
      return backoffDelay(config_, attempt);
    }
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<> dist(1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor);
    return backoffDelay(config_, attempt, dist(rng_));
  }

  /**
   * @return true if @p error is transient and fewer than max_retries retries were made
   */
  bool shouldRetry(const StoreError& error, int attempt) const {
    return error.retryable && attempt < config_.max_retries;
  }

  int maxRetries() const {
    return config_.max_retries;
  }

  /**
   * Map an S3 or transport error code to its retryability
   *
   * Codes describing upload or object state (NoSuchUpload, InvalidPart, ...)
   * are permanent: the engine reacts to them instead.
   */
  static bool isRetryableError(const std::string& error_code) {
    static constexpr std::array<const char*, 16> kTransientCodes = {
      // Server side
      "InternalError", "ServiceUnavailable", "RequestTimeout", "RequestTimeTooSkewed",
      "OperationAborted", "XMinioServerNotInitialized", "XAmzContentSHA256Mismatch",
      // Throttling
      "SlowDown", "Throttling", "ThrottlingException",
      // Transport, reported by the SDK
      "ConnectionReset", "ConnectionTimeout", "ConnectionRefused", "NetworkingError",
      "UnknownEndpoint", "TransientError"};
    return std::any_of(kTransientCodes.begin(), kTransientCodes.end(), [&](const char* code) {
      return error_code == code;
    });
  }

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_RETRY_HANDLER_HPP
