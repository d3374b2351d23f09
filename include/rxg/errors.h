#pragma once

#include <string_view>

namespace rxg::errors::msg {
// centralized message catalog
inline constexpr std::string_view kMasterKeyLength{"Invalid master key length"};
inline constexpr std::string_view kMasterKeyUnreadable{"Unable to read master key"};
inline constexpr std::string_view kChunkAuthenticationFailed{"Chunk authentication failed"};
inline constexpr std::string_view kChunkMissing{"Chunk not found"};
inline constexpr std::string_view kChunkHashMalformed{"Chunk hash malformed"};
inline constexpr std::string_view kSnapshotMissing{"Snapshot not found"};
inline constexpr std::string_view kManifestMalformed{"Snapshot manifest malformed"};
inline constexpr std::string_view kManifestIdMismatch{"Snapshot manifest id does not match file name"};
inline constexpr std::string_view kRestorePathEscape{"Restore path escapes destination"};
inline constexpr std::string_view kRestorePartial{"Restore completed with failures"};
inline constexpr std::string_view kConfigMalformed{"Configuration file malformed"};
inline constexpr std::string_view kConfigNotFound{"Configuration file not found"};
inline constexpr std::string_view kConfigMissingKey{"Configuration key missing"};
inline constexpr std::string_view kConfigNoDataDirs{"At least one data directory is required"};
inline constexpr std::string_view kCanaryMetadataMalformed{"Canary metadata malformed"};
inline constexpr std::string_view kWatchSetupFailed{"Unable to watch directory"};
}  // namespace rxg::errors::msg
