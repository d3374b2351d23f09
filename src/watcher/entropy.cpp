#include "rxg/watcher/entropy.h"

#include <array>
#include <cmath>
#include <fstream>
#include <vector>

namespace rxg::watcher {

double ShannonEntropy(std::span<const uint8_t> data) noexcept {
  if (data.empty()) {
    return 0.0;
  }

  std::array<std::size_t, 256> counts{};
  for (uint8_t byte : data) {
    ++counts[byte];
  }

  const double length = static_cast<double>(data.size());
  double entropy = 0.0;
  for (auto count : counts) {
    if (count == 0) {
      continue;
    }
    const double probability = static_cast<double>(count) / length;
    entropy -= probability * std::log2(probability);
  }
  return entropy;
}

std::optional<double> SampleFileEntropy(const std::filesystem::path& path, std::size_t max_bytes) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::vector<uint8_t> sample(max_bytes);
  in.read(reinterpret_cast<char*>(sample.data()), static_cast<std::streamsize>(sample.size()));
  if (in.bad()) {
    return std::nullopt;
  }
  sample.resize(static_cast<std::size_t>(in.gcount()));
  return ShannonEntropy(sample);
}

}  // namespace rxg::watcher
