// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_signature.hpp"

namespace hoist {
namespace transfer {

std::optional<FileSignature> captureFileSignature(
  const std::string& path, const IFileSystem& filesystem
) {
  if (path.empty() || !filesystem.exists(path)) {
    return std::nullopt;
  }

  auto size = filesystem.file_size(path);
  if (!size) {
    return std::nullopt;
  }
  auto mtime = filesystem.last_write_time_ns(path);
  if (!mtime) {
    return std::nullopt;
  }

  FileSignature signature;
  signature.size_bytes = *size;
  signature.last_modified_ns = *mtime;
  return signature;
}

}  // namespace transfer
}  // namespace hoist
