// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef HOIST_UPLOAD_REQUEST_HPP
#define HOIST_UPLOAD_REQUEST_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace hoist {
namespace transfer {

class TransferListener;

/**
 * Upload of one local file to one object
 *
 * The manager copies the request on submission.
 */
struct UploadFileRequest {
  std::string bucket;
  std::string key;
  std::string source;  // Local file path
  std::string content_type = "application/octet-stream";
  std::map<std::string, std::string> metadata;

  // Not part of a resumable token
  std::vector<std::shared_ptr<TransferListener>> listeners;

  ObjectKey object() const {
    return ObjectKey{bucket, key};
  }

  ObjectAttributes attributes() const {
    ObjectAttributes attrs;
    attrs.content_type = content_type;
    attrs.metadata = metadata;
    return attrs;
  }
};

}  // namespace transfer
}  // namespace hoist

#endif  // HOIST_UPLOAD_REQUEST_HPP
