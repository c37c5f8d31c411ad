#pragma once

#include "core/errors/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace autopsy::store {

inline constexpr std::uint64_t kDefaultFingerprintHeadBytes = 2'000'000;

// Fast identity signature for very large measurement files.
//
// Digest input, in order:
// - decimal file size in bytes
// - decimal modification time truncated to whole seconds
// - the first `head_bytes` bytes of content
//
// Contract:
// - identical (size, mtime, head) => identical lowercase hex SHA-256 signature
// - any size or mtime change => different signature
// - edits strictly after the head window that keep size and mtime are NOT
//   detected; full-file hashing is deliberately avoided for multi-GB logs
// - missing/unreadable path => false with ErrorKind::kIo
bool FingerprintFile(const std::filesystem::path& path, std::uint64_t head_bytes,
                     std::string& signature, core::errors::Error& error);

inline bool FingerprintFile(const std::filesystem::path& path, std::string& signature,
                            core::errors::Error& error) {
  return FingerprintFile(path, kDefaultFingerprintHeadBytes, signature, error);
}

} // namespace autopsy::store
