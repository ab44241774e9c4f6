// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "resumable_upload.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <sstream>
#include <stdexcept>

namespace hoist {
namespace transfer {

namespace {

// Bumped when the token layout changes incompatibly
constexpr int kTokenVersion = 1;

}  // namespace

bool ResumableUpload::isConsistent() const {
  const int present = static_cast<int>(multipart_upload_id.has_value()) +
                      static_cast<int>(part_size_bytes.has_value()) +
                      static_cast<int>(total_parts.has_value()) +
                      static_cast<int>(transferred_parts.has_value());
  if (present == 0) {
    return true;
  }
  if (present != 4) {
    return false;
  }

  if (multipart_upload_id->empty() || *part_size_bytes == 0 || *total_parts == 0) {
    return false;
  }

  // Parts must cover the file exactly
  const uint64_t expected_parts = (file_length + *part_size_bytes - 1) / *part_size_bytes;
  if (expected_parts != *total_parts) {
    return false;
  }

  std::set<int> seen;
  for (const auto& part : *transferred_parts) {
    if (part.part_number < 1 || static_cast<uint32_t>(part.part_number) > *total_parts) {
      return false;
    }
    if (!seen.insert(part.part_number).second) {
      return false;
    }
  }
  return true;
}

uint64_t ResumableUpload::transferredBytes() const {
  uint64_t total = 0;
  if (transferred_parts) {
    for (const auto& part : *transferred_parts) {
      total += part.size_bytes;
    }
  }
  return total;
}

std::string ResumableUpload::describe() const {
  std::ostringstream oss;
  oss << request.object().str() << " source=" << request.source << " length=" << file_length;
  if (hasMultipartState()) {
    oss << " upload_id=" << *multipart_upload_id << " part_size=" << *part_size_bytes
        << " parts=" << transferred_parts->size() << "/" << *total_parts;
  } else {
    oss << " multipart=none";
  }
  return oss.str();
}

std::string ResumableUpload::toJson() const {
  nlohmann::json j;
  j["version"] = kTokenVersion;
  j["bucket"] = request.bucket;
  j["key"] = request.key;
  j["source"] = request.source;
  j["content_type"] = request.content_type;
  j["metadata"] = request.metadata;
  j["file_length"] = file_length;
  j["file_last_modified_ns"] = file_last_modified_ns;

  if (multipart_upload_id) {
    j["multipart_upload_id"] = *multipart_upload_id;
  }
  if (part_size_bytes) {
    j["part_size_bytes"] = *part_size_bytes;
  }
  if (total_parts) {
    j["total_parts"] = *total_parts;
  }
  if (transferred_parts) {
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& part : *transferred_parts) {
      parts.push_back(
        {{"part_number", part.part_number}, {"etag", part.etag}, {"size_bytes", part.size_bytes}}
      );
    }
    j["transferred_parts"] = parts;
  }

  return j.dump();
}

ResumableUpload ResumableUpload::fromJson(const std::string& json) {
  ResumableUpload token;

  try {
    auto j = nlohmann::json::parse(json);
    if (!j.is_object()) {
      throw std::invalid_argument("Resume token must be a JSON object");
    }

    int version = j.value("version", kTokenVersion);
    if (version != kTokenVersion) {
      throw std::invalid_argument("Unsupported resume token version: " + std::to_string(version));
    }

    token.request.bucket = j.at("bucket").get<std::string>();
    token.request.key = j.at("key").get<std::string>();
    token.request.source = j.at("source").get<std::string>();
    token.request.content_type = j.value("content_type", std::string("application/octet-stream"));
    if (j.contains("metadata") && !j["metadata"].is_null()) {
      token.request.metadata = j["metadata"].get<std::map<std::string, std::string>>();
    }
    token.file_length = j.at("file_length").get<uint64_t>();
    token.file_last_modified_ns = j.at("file_last_modified_ns").get<int64_t>();

    auto present = [&j](const char* field) {
      return j.contains(field) && !j[field].is_null();
    };

    if (present("multipart_upload_id")) {
      token.multipart_upload_id = j["multipart_upload_id"].get<std::string>();
    }
    if (present("part_size_bytes")) {
      token.part_size_bytes = j["part_size_bytes"].get<uint64_t>();
    }
    if (present("total_parts")) {
      token.total_parts = j["total_parts"].get<uint32_t>();
    }
    if (present("transferred_parts")) {
      std::vector<CompletedPart> parts;
      for (const auto& item : j["transferred_parts"]) {
        CompletedPart part;
        part.part_number = item.at("part_number").get<int>();
        part.etag = item.at("etag").get<std::string>();
        part.size_bytes = item.value("size_bytes", static_cast<uint64_t>(0));
        parts.push_back(std::move(part));
      }
      token.transferred_parts = std::move(parts);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("Malformed resume token: ") + e.what());
  }

  if (token.request.bucket.empty() || token.request.key.empty()) {
    throw std::invalid_argument("Resume token has no destination");
  }
  if (!token.isConsistent()) {
    throw std::invalid_argument("Inconsistent resume token: " + token.describe());
  }
  return token;
}

}  // namespace transfer
}  // namespace hoist
