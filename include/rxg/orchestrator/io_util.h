#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <system_error>
#include <vector>

#include "rxg/error.h"

namespace rxg::orchestrator {

struct AtomicReplaceHooks { // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place. The result is owner read/write only. Missing parent directories
// are created.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Creates or truncates |path| with mode 0600 and writes |payload| durably.
void WritePrivateFile(const std::filesystem::path& path, std::span<const uint8_t> payload);

// Reads the whole file. Throws NotFoundError when |path| does not exist and
// Error{IO} on any other failure.
std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path);

// create_directories with errors mapped onto Error{IO}.
void EnsureDirectory(const std::filesystem::path& dir);

struct TreeWalkVisitor {
  // Called before a directory below the root is opened. Returning false
  // skips its contents.
  std::function<bool(const std::filesystem::path&)> enter_directory;
  std::function<void(const std::filesystem::path&)> regular_file;
  // A directory that could not be opened or listed. Its siblings are still
  // visited.
  std::function<void(const std::filesystem::path&, const std::error_code&)> unreadable;
};

// Depth-first walk that never follows symlinks and never stops early on a
// directory that vanishes or cannot be read.
void WalkTree(const std::filesystem::path& root, const TreeWalkVisitor& visitor);

}  // namespace rxg::orchestrator
