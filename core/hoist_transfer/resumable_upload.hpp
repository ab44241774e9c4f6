// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_RESUMABLE_UPLOAD_HPP
#define HOIST_RESUMABLE_UPLOAD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "object_store.hpp"
#include "upload_request.hpp"

namespace hoist {
namespace transfer {

/**
 * Resumable token produced by pausing an upload
 *
 * A plain data record with no tie to the manager that produced it, so any
 * compatible TransferManager (or another process, via toJson()) can resume it.
 *
 * The multipart fields are either all empty (single-part transfer, or paused
 * before the multipart upload was registered) or all present.
 * transferred_parts may be present and hold an empty list.
 */
struct ResumableUpload {
  UploadFileRequest request;  // listeners are not carried over
  uint64_t file_length = 0;
  int64_t file_last_modified_ns = 0;

  std::optional<std::string> multipart_upload_id;
  std::optional<uint64_t> part_size_bytes;
  std::optional<uint32_t> total_parts;
  std::optional<std::vector<CompletedPart>> transferred_parts;

  /**
   * True when the multipart fields are populated
   */
  bool hasMultipartState() const {
    return multipart_upload_id.has_value() && part_size_bytes.has_value() &&
           total_parts.has_value() && transferred_parts.has_value();
  }

  /**
   * Check the all-or-none rule and the ranges of the multipart fields
   */
  bool isConsistent() const;

  /**
   * Bytes covered by transferred_parts (0 without multipart state)
   */
  uint64_t transferredBytes() const;

  /**
   * One-line summary for logs
   */
  std::string describe() const;

  /**
   * Serialize to a JSON document
   */
  std::string toJson() const;

  /**
   * Parse a token produced by toJson()
   * @throws std::invalid_argument on malformed JSON or an inconsistent token
   */
  static ResumableUpload fromJson(const std::string& json);
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_RESUMABLE_UPLOAD_HPP
