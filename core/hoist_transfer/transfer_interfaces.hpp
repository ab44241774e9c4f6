// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_TRANSFER_INTERFACES_HPP
#define HOIST_TRANSFER_INTERFACES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace hoist {
namespace transfer {

/**
 * Interface for the local filesystem reads a transfer performs
 * Allows mocking filesystem failures in tests
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  /**
   * Check if a regular file exists
   */
  virtual bool exists(const std::string& path) const = 0;

  /**
   * Size of a file in bytes, or nullopt if it cannot be read
   */
  virtual std::optional<uint64_t> file_size(const std::string& path) const = 0;

  /**
   * Last modification time in nanoseconds since the filesystem clock epoch,
   * or nullopt if it cannot be read
   */
  virtual std::optional<int64_t> last_write_time_ns(const std::string& path) const = 0;

  /**
   * Read up to @p length bytes starting at @p offset
   * @param out Receives the bytes read
   * @return true if exactly @p length bytes were read
   */
  virtual bool read_range(
    const std::string& path, uint64_t offset, uint64_t length, std::string& out
  ) const = 0;
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_TRANSFER_INTERFACES_HPP
