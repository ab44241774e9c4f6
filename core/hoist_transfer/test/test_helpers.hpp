// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_TRANSFER_TEST_HELPERS_HPP
#define HOIST_TRANSFER_TEST_HELPERS_HPP

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hoist {
namespace transfer {
namespace test {

namespace fs = std::filesystem;

constexpr uint64_t kMiB = 1024ULL * 1024;

/**
 * Create a temporary directory for testing
 */
inline std::string createTempDir(const std::string& prefix = "hoist_test_") {
  std::string dir =
    "/tmp/" + prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  fs::create_directories(dir);
  return dir;
}

/**
 * Generate a test file of specified size
 *
 * Content varies with the offset so that misplaced parts are detected.
 */
inline std::string generateTestFile(const std::string& path, size_t size_bytes) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return "";
  }

  std::vector<char> data(size_bytes);
  for (size_t i = 0; i < size_bytes; ++i) {
    data[i] = static_cast<char>('a' + (i / 4096) % 26);
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.close();

  return path;
}

inline std::string readFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

/**
 * Check if MinIO is available (basic check via environment variables)
 */
inline bool isMinIOAvailable() {
  return std::getenv("AWS_ACCESS_KEY_ID") != nullptr &&
         std::getenv("AWS_SECRET_ACCESS_KEY") != nullptr;
}

/**
 * Clean up temporary directory and files
 */
inline void cleanupTempDir(const std::string& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
}

/**
 * Poll @p condition until it holds or @p timeout expires
 */
inline bool waitUntil(
  const std::function<bool()>& condition,
  std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)
) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

/**
 * One-shot latch that blocks callers until opened
 */
class Gate {
public:
  void open() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    ++waiting_;
    cv_.wait(lock, [this] {
      return open_;
    });
    --waiting_;
  }

  int waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
  int waiting_ = 0;
};

}  // namespace test
}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_TRANSFER_TEST_HELPERS_HPP
