// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_FILE_SIGNATURE_HPP
#define HOIST_FILE_SIGNATURE_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "transfer_interfaces.hpp"

namespace hoist {
namespace transfer {

/**
 * Size and modification time of a source file
 *
 * Recorded when a transfer starts and compared on resume to detect that the
 * source was replaced or edited.
 */
struct FileSignature {
  uint64_t size_bytes = 0;
  int64_t last_modified_ns = 0;

  bool operator==(const FileSignature& other) const {
    return size_bytes == other.size_bytes && last_modified_ns == other.last_modified_ns;
  }

  bool operator!=(const FileSignature& other) const {
    return !(*this == other);
  }
};

/**
 * Read the signature of @p path
 * @return nullopt if the file is missing or its attributes cannot be read
 */
std::optional<FileSignature> captureFileSignature(
  const std::string& path, const IFileSystem& filesystem
);

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_FILE_SIGNATURE_HPP
