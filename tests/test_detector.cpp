#include "rxg/watcher/detector.h"

#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "rxg/common.h"
#include "rxg/crypto/random.h"
#include "rxg/error.h"
#include "rxg/orchestrator/config.h"
#include "rxg/orchestrator/event_bus.h"
#include "rxg/watcher/entropy.h"

namespace {

using rxg::watcher::SteadyClock;

class TempDir {
public:
  TempDir() {
    std::array<uint8_t, 8> token{};
    rxg::crypto::SystemRandomBytes(token);
    path_ = std::filesystem::temp_directory_path() / ("rxg_detector_" + rxg::HexEncode(token));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

void WriteFile(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> RandomBytes(std::size_t size) {
  std::vector<uint8_t> data(size);
  rxg::crypto::SystemRandomBytes(data);
  return data;
}

void TestShannonEntropy() {
  assert(rxg::watcher::ShannonEntropy({}) == 0.0);
  std::vector<uint8_t> zeros(4096, 0);
  assert(rxg::watcher::ShannonEntropy(zeros) == 0.0);

  std::vector<uint8_t> two_symbols(4096);
  for (std::size_t i = 0; i < two_symbols.size(); ++i) {
    two_symbols[i] = static_cast<uint8_t>(i % 2);
  }
  const double one_bit = rxg::watcher::ShannonEntropy(two_symbols);
  assert(one_bit > 0.999 && one_bit < 1.001);

  std::vector<uint8_t> every_byte(256 * 16);
  for (std::size_t i = 0; i < every_byte.size(); ++i) {
    every_byte[i] = static_cast<uint8_t>(i);
  }
  assert(rxg::watcher::ShannonEntropy(every_byte) > 7.999);

  assert(rxg::watcher::ShannonEntropy(RandomBytes(4096)) >= 7.5);
}

void TestSampleFileEntropy(const TempDir& tmp) {
  const auto noisy = tmp.path() / "noisy.bin";
  WriteFile(noisy, RandomBytes(64 * 1024));
  auto entropy = rxg::watcher::SampleFileEntropy(noisy, 4096);
  assert(entropy && *entropy >= 7.5);

  const auto text = tmp.path() / "notes.txt";
  WriteFile(text, std::vector<uint8_t>(8192, 'a'));
  entropy = rxg::watcher::SampleFileEntropy(text, 4096);
  assert(entropy && *entropy == 0.0);

  assert(!rxg::watcher::SampleFileEntropy(tmp.path() / "vanished.bin", 4096).has_value());
}

void TestSurgeWindow() {
  const auto start = SteadyClock::now();
  rxg::watcher::SurgeWindow window(std::chrono::seconds(60), 200);

  // 200 modifications within ten seconds
  for (int i = 0; i < 200; ++i) {
    window.Record(start + std::chrono::milliseconds(i * 50));
  }
  assert(window.Surging(start + std::chrono::seconds(10)));
  // all of them age out of the window
  assert(!window.Surging(start + std::chrono::seconds(75)));
  assert(window.Prune(start + std::chrono::seconds(75)) == 0);

  rxg::watcher::SurgeWindow slow(std::chrono::seconds(60), 200);
  for (int i = 0; i < 10; ++i) {
    slow.Record(start + std::chrono::seconds(i * 6));
  }
  assert(!slow.Surging(start + std::chrono::seconds(60)));

  rxg::watcher::SurgeWindow batched(std::chrono::seconds(60), 200);
  batched.Record(start, 199);
  assert(!batched.Surging(start));
  batched.Record(start + std::chrono::seconds(1), 1);
  assert(batched.Surging(start + std::chrono::seconds(1)));
}

void TestDetectorSignals(const TempDir& tmp) {
  auto config = rxg::orchestrator::Config::Default(tmp.path() / "repo", {tmp.path()});
  std::size_t tampered = 0;
  rxg::watcher::ActivityDetector detector(config, [&tampered]() { return tampered; });
  auto now = SteadyClock::now();

  const auto calm = tmp.path() / "calm.txt";
  WriteFile(calm, std::vector<uint8_t>(4096, 'z'));
  auto signals = detector.Evaluate({rxg::PathToUtf8String(calm)}, 1, now);
  assert(!signals.Any());
  assert(signals.Describe().empty());

  assert(detector.IsSuspiciousExtension("/data/report.pdf.locked"));
  assert(detector.IsSuspiciousExtension("/data/REPORT.PDF.ENCRYPTED"));
  assert(!detector.IsSuspiciousExtension("/data/report.pdf"));
  assert(!detector.IsSuspiciousExtension("/data/locked"));
  signals = detector.Evaluate({"/data/never-created.crypt"}, 1, now);
  assert(signals.suspicious_extension && !signals.high_entropy);

  const auto scrambled = tmp.path() / "scan.dcm";
  WriteFile(scrambled, RandomBytes(8192));
  signals = detector.Evaluate({rxg::PathToUtf8String(scrambled)}, 1, now);
  assert(signals.high_entropy);
  assert(detector.LastMaxEntropy() >= 7.5);

  tampered = 1;
  signals = detector.Evaluate({}, 0, now);
  assert(signals.canary_tamper && signals.Any());
  assert(signals.Describe() == "canary_tamper");
  tampered = 0;

  signals = detector.Evaluate({}, 250, now + std::chrono::seconds(1));
  assert(signals.surge);
}

void TestEntropySampleLimit(const TempDir& tmp) {
  auto config = rxg::orchestrator::Config::Default(tmp.path() / "repo", {tmp.path()});
  config.entropy_sample_files = 2;
  rxg::watcher::ActivityDetector detector(config, nullptr);

  std::vector<std::string> paths;
  for (int i = 0; i < 2; ++i) {
    auto path = tmp.path() / ("plain" + std::to_string(i) + ".txt");
    WriteFile(path, std::vector<uint8_t>(4096, 'q'));
    // duplicates do not consume the sample budget
    paths.push_back(rxg::PathToUtf8String(path));
    paths.push_back(rxg::PathToUtf8String(path));
  }
  const auto noisy = tmp.path() / "late.bin";
  WriteFile(noisy, RandomBytes(4096));
  paths.push_back(rxg::PathToUtf8String(noisy));

  auto signals = detector.Evaluate(paths, paths.size(), SteadyClock::now());
  assert(!signals.high_entropy && "only the first distinct files are sampled");
}

void TestCanaryCheckFailureCountsAsTamper(const TempDir& tmp) {
  auto config = rxg::orchestrator::Config::Default(tmp.path() / "repo", {tmp.path()});
  rxg::watcher::ActivityDetector detector(config, []() -> std::size_t {
    throw rxg::Error{rxg::ErrorDomain::Validation, 0, "metadata unreadable"};
  });
  auto signals = detector.Evaluate({}, 0, SteadyClock::now());
  assert(signals.canary_tamper);
}

}  // namespace

int main() {
  TempDir tmp;
  TestShannonEntropy();
  TestSampleFileEntropy(tmp);
  TestSurgeWindow();
  TestDetectorSignals(tmp);
  TestEntropySampleLimit(tmp);
  TestCanaryCheckFailureCountsAsTamper(tmp);
  rxg::orchestrator::ResetEventBusForTesting();
  std::cout << "detector tests ok\n";
  return 0;
}
