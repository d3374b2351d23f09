#include "rxg/snapshot/manifest.h"

#include <nlohmann/json.hpp>

#include "rxg/common.h"
#include "rxg/error.h"
#include "rxg/errors.h"

namespace rxg::snapshot {
namespace {

using nlohmann::json;

[[noreturn]] void ThrowCorrupt(const std::string& detail) {
  throw CorruptManifestError(std::string(errors::msg::kManifestMalformed) + ": " + detail);
}

const json& RequireField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end()) {
    ThrowCorrupt(std::string("missing field '") + key + "'");
  }
  return *it;
}

FileEntry ParseFileEntry(const json& node) {
  if (!node.is_object()) {
    ThrowCorrupt("file entry is not an object");
  }
  FileEntry entry;
  entry.path = RequireField(node, "path").get<std::string>();
  const auto& size = RequireField(node, "size");
  if (!size.is_number_unsigned()) {
    ThrowCorrupt("size of '" + entry.path + "' is not an unsigned integer");
  }
  entry.size = size.get<uint64_t>();
  entry.mtime_ns = RequireField(node, "mtime_ns").get<int64_t>();
  const auto& chunks = RequireField(node, "chunks");
  if (!chunks.is_array()) {
    ThrowCorrupt("chunks of '" + entry.path + "' is not an array");
  }
  entry.chunks.reserve(chunks.size());
  for (const auto& hash : chunks) {
    auto value = hash.get<std::string>();
    if (!IsHexDigest(value)) {
      ThrowCorrupt("invalid chunk hash in '" + entry.path + "'");
    }
    entry.chunks.push_back(std::move(value));
  }
  if (entry.path.empty()) {
    ThrowCorrupt("file entry with empty path");
  }
  return entry;
}

}  // namespace

std::string SerializeManifest(const Snapshot& snapshot) {
  json files = json::array();
  for (const auto& entry : snapshot.files) {
    files.push_back(json{{"path", entry.path},
                         {"size", entry.size},
                         {"mtime_ns", entry.mtime_ns},
                         {"chunks", entry.chunks}});
  }
  json doc;
  doc["id"] = snapshot.id;
  doc["created_at"] = snapshot.created_at;
  doc["version"] = snapshot.version;
  doc["label"] = snapshot.label ? json(*snapshot.label) : json(nullptr);
  doc["files"] = std::move(files);
  return doc.dump(2) + "\n";
}

Snapshot ParseManifest(std::string_view text) {
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error& ex) {
    ThrowCorrupt(ex.what());
  }
  if (!doc.is_object()) {
    ThrowCorrupt("document is not an object");
  }

  Snapshot snapshot;
  try {
    snapshot.id = RequireField(doc, "id").get<std::string>();
    snapshot.created_at = RequireField(doc, "created_at").get<std::string>();
    snapshot.version = RequireField(doc, "version").get<int>();
    auto label = doc.find("label");
    if (label != doc.end() && !label->is_null()) {
      snapshot.label = label->get<std::string>();
    }
    const auto& files = RequireField(doc, "files");
    if (!files.is_array()) {
      ThrowCorrupt("files is not an array");
    }
    snapshot.files.reserve(files.size());
    for (const auto& node : files) {
      snapshot.files.push_back(ParseFileEntry(node));
    }
  } catch (const json::exception& ex) {
    ThrowCorrupt(ex.what());
  }
  if (snapshot.version != kManifestVersion) {
    ThrowCorrupt("unsupported version " + std::to_string(snapshot.version));
  }
  return snapshot;
}

}  // namespace rxg::snapshot
