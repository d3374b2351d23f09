#include "rxg/snapshot/manifest.h"

#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "rxg/error.h"

namespace {

rxg::snapshot::Snapshot SampleSnapshot() {
  rxg::snapshot::Snapshot snapshot;
  snapshot.id = "20240102T030405Z";
  snapshot.created_at = "2024-01-02T03:04:05.123456+00:00";
  snapshot.files.push_back({"/data/a.txt", 1024, 1704164645000000000, {"0123456789abcdef"}});
  snapshot.files.push_back({"/data/big.bin", 5 * 1024 * 1024, 1704164645000000001,
                            {"1111111111111111", "2222222222222222"}});
  snapshot.files.push_back({"/data/empty", 0, 1704164645000000002, {}});
  return snapshot;
}

bool IsCorrupt(const std::string& text) {
  try {
    (void)rxg::snapshot::ParseManifest(text);
  } catch (const rxg::CorruptManifestError& err) {
    return err.code == rxg::errors::validation::kCorruptManifest;
  }
  return false;
}

void TestDocumentShape() {
  auto snapshot = SampleSnapshot();
  const auto text = rxg::snapshot::SerializeManifest(snapshot);
  assert(!text.empty() && text.back() == '\n');
  assert(text.find("\n  \"files\"") != std::string::npos && "two-space indentation");

  auto doc = nlohmann::json::parse(text);
  assert(doc["label"].is_null());
  assert(doc["version"] == 1);
  assert(doc["files"].size() == 3);
  assert(doc["files"][2]["chunks"].empty());

  auto parsed = rxg::snapshot::ParseManifest(text);
  assert(parsed.id == snapshot.id);
  assert(parsed.created_at == snapshot.created_at);
  assert(!parsed.label.has_value());
  assert(parsed.files.size() == 3);
  assert(parsed.files[1].chunks.size() == 2);
  assert(parsed.files[1].size == 5u * 1024 * 1024);
  assert(parsed.files[0].mtime_ns == 1704164645000000000);

  snapshot.label = "auto-alert";
  parsed = rxg::snapshot::ParseManifest(rxg::snapshot::SerializeManifest(snapshot));
  assert(parsed.label && *parsed.label == "auto-alert");
}

void TestCorruptDocuments() {
  assert(IsCorrupt(""));
  assert(IsCorrupt("{not json"));
  assert(IsCorrupt("[]"));
  assert(IsCorrupt(R"({"id":"x","created_at":"t","version":1})"));
  assert(IsCorrupt(R"({"id":"x","created_at":"t","version":2,"label":null,"files":[]})"));
  assert(IsCorrupt(R"({"id":"x","created_at":"t","version":1,"files":{}})"));
  assert(IsCorrupt(R"({"id":"x","created_at":"t","version":1,"files":[{"path":"/a","size":"big","mtime_ns":0,"chunks":[]}]})"));
  assert(IsCorrupt(R"({"id":"x","created_at":"t","version":1,"files":[{"path":"/a","size":1,"mtime_ns":0,"chunks":["../../x"]}]})"));
  // a negative or fractional size must not wrap into a huge unsigned value
  assert(IsCorrupt(R"({"id":"x","created_at":"t","version":1,"files":[{"path":"/a","size":-1,"mtime_ns":0,"chunks":[]}]})"));
  assert(IsCorrupt(R"({"id":"x","created_at":"t","version":1,"files":[{"path":"/a","size":1.5,"mtime_ns":0,"chunks":[]}]})"));
  assert(!IsCorrupt(R"({"id":"x","created_at":"t","version":1,"files":[]})"));
}

}  // namespace

int main() {
  TestDocumentShape();
  TestCorruptDocuments();
  std::cout << "manifest tests ok\n";
  return 0;
}
