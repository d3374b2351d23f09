#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

namespace rxg::watcher {

// Shannon entropy over byte-value frequency, in bits per byte (0.0 .. 8.0).
// Empty input yields 0.
double ShannonEntropy(std::span<const uint8_t> data) noexcept;

// Entropy of the first |max_bytes| of |path|; std::nullopt when the file
// cannot be opened or read.
std::optional<double> SampleFileEntropy(const std::filesystem::path& path, std::size_t max_bytes);

}  // namespace rxg::watcher
