#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>

#include "tw/error.h"

namespace tw::storage {

struct AtomicReplaceHooks { // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file in the same directory, syncing it to disk, then renaming it
// into place. The new file gets |permissions| before it becomes visible.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   mode_t permissions, const AtomicReplaceHooks& hooks = {});

// Reads a whole file. Returns std::nullopt when the file does not exist.
std::optional<std::string> ReadWholeFile(const std::filesystem::path& path);

// Creates |dir| and any missing parents with |permissions|.
void EnsureDirectory(const std::filesystem::path& dir, mode_t permissions);

}  // namespace tw::storage
