#include "rxg/canary/canary_manager.h"

#include <array>
#include <string_view>

#include <nlohmann/json.hpp>

#include "rxg/common.h"
#include "rxg/crypto/content_hash.h"
#include "rxg/crypto/random.h"
#include "rxg/error.h"
#include "rxg/errors.h"
#include "rxg/orchestrator/event_bus.h"
#include "rxg/orchestrator/io_util.h"

namespace rxg::canary {
namespace {

using nlohmann::json;
using rxg::orchestrator::Event;
using rxg::orchestrator::EventBus;
using rxg::orchestrator::EventCategory;
using rxg::orchestrator::EventField;
using rxg::orchestrator::EventSeverity;
using rxg::orchestrator::FieldPrivacy;

// Decoy extensions chosen to look like clinical office documents and scans.
constexpr std::array<std::string_view, 5> kDecoyExtensions{".xlsx", ".pdf", ".dcm", ".docx", ".txt"};
constexpr size_t kNameLetters = 8;

std::string RandomCanaryName() {
  std::string name = "canary-";
  for (size_t i = 0; i < kNameLetters; ++i) {
    name.push_back(static_cast<char>('a' + rxg::crypto::RandomUniform(26)));
  }
  name.append(kDecoyExtensions[rxg::crypto::RandomUniform(static_cast<uint32_t>(kDecoyExtensions.size()))]);
  return name;
}

[[noreturn]] void ThrowMalformed(const std::string& detail) {
  throw Error{ErrorDomain::Validation, errors::validation::kCorruptManifest,
              std::string(errors::msg::kCanaryMetadataMalformed) + ": " + detail};
}

}  // namespace

CanaryManager::CanaryManager(const rxg::orchestrator::Config& config)
    : data_dirs_(config.data_dirs), metadata_path_(config.canary_dir / kCanaryMetadataFile) {}

std::vector<Canary> CanaryManager::Deploy(std::size_t per_directory) {
  std::vector<Canary> canaries;
  canaries.reserve(data_dirs_.size() * per_directory);
  std::array<uint8_t, kCanaryContentBytes> content{};

  for (const auto& dir : data_dirs_) {
    rxg::orchestrator::EnsureDirectory(dir);
    for (std::size_t i = 0; i < per_directory; ++i) {
      auto path = dir / RandomCanaryName();
      rxg::crypto::SystemRandomBytes(content);
      rxg::orchestrator::AtomicReplace(path, content);
      canaries.push_back(Canary{PathToUtf8String(path), rxg::crypto::ContentHash(content)});
    }
  }
  SaveMetadata(canaries);

  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = "canaries_deployed";
  event.message = "Canary set replaced";
  event.fields.emplace_back("count", std::to_string(canaries.size()), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
  return canaries;
}

void CanaryManager::SaveMetadata(const std::vector<Canary>& canaries) const {
  json doc = json::array();
  for (const auto& canary : canaries) {
    doc.push_back(json{{"path", canary.path}, {"hash", canary.hash}});
  }
  const std::string text = doc.dump(2) + "\n";
  rxg::orchestrator::AtomicReplace(metadata_path_, AsByteSpan(text));
}

std::vector<Canary> CanaryManager::Tracked() const {
  std::vector<uint8_t> raw;
  try {
    raw = rxg::orchestrator::ReadFileBytes(metadata_path_);
  } catch (const NotFoundError&) {
    return {};
  }
  std::vector<Canary> canaries;
  try {
    auto doc = json::parse(raw.begin(), raw.end());
    if (!doc.is_array()) {
      ThrowMalformed("expected a list");
    }
    for (const auto& node : doc) {
      canaries.push_back(Canary{node.at("path").get<std::string>(), node.at("hash").get<std::string>()});
    }
  } catch (const json::exception& ex) {
    ThrowMalformed(ex.what());
  }
  return canaries;
}

CanaryReport CanaryManager::Inspect() const {
  CanaryReport report;
  const auto canaries = Tracked();
  report.total = canaries.size();
  for (const auto& canary : canaries) {
    try {
      auto data = rxg::orchestrator::ReadFileBytes(canary.path);
      if (rxg::crypto::ContentHash(data) != canary.hash) {
        report.tampered.push_back(canary.path);
      }
    } catch (const Error&) {
      // missing or unreadable counts as tampered
      report.tampered.push_back(canary.path);
    }
  }
  return report;
}

std::size_t CanaryManager::Check() const {
  return Inspect().tampered.size();
}

}  // namespace rxg::canary
