// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_TRANSFER_IMPL_HPP
#define HOIST_TRANSFER_IMPL_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "transfer_interfaces.hpp"

namespace hoist {
namespace transfer {

/**
 * Default implementation of IFileSystem using std::filesystem and std::ifstream
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);  // LCOV_EXCL_BR_LINE
  }

  std::optional<uint64_t> file_size(const std::string& path) const override {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);  // LCOV_EXCL_BR_LINE
    if (ec) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(size);
  }

  std::optional<int64_t> last_write_time_ns(const std::string& path) const override {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path, ec);  // LCOV_EXCL_BR_LINE
    if (ec) {
      return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
  }

  bool read_range(
    const std::string& path, uint64_t offset, uint64_t length, std::string& out
  ) const override {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
      return false;
    }
    stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream) {
      return false;
    }
    out.resize(length);
    stream.read(&out[0], static_cast<std::streamsize>(length));
    return static_cast<uint64_t>(stream.gcount()) == length;
  }
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_TRANSFER_IMPL_HPP
