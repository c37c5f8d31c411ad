#include "store/fingerprint.hpp"

#include "core/hash/sha256.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace autopsy::store {

using core::errors::ErrorKind;

namespace {

constexpr std::size_t kReadChunkBytes = 64U * 1024U;

} // namespace

bool FingerprintFile(const fs::path& path, const std::uint64_t head_bytes, std::string& signature,
                     core::errors::Error& error) {
  error.Clear();
  signature.clear();

  struct stat file_stat {};
  if (::stat(path.c_str(), &file_stat) != 0) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "cannot stat measurement file '" + path.string() +
                                  "': " + std::strerror(errno));
  }
  if (!S_ISREG(file_stat.st_mode)) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "measurement path is not a regular file: " + path.string());
  }

  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "failed to open measurement file for fingerprinting: " +
                                  path.string());
  }

  std::string hash_error;
  core::hash::Sha256Hasher hasher;
  if (!hasher.Update(std::to_string(static_cast<std::uint64_t>(file_stat.st_size)), hash_error) ||
      !hasher.Update(std::to_string(static_cast<std::int64_t>(file_stat.st_mtime)), hash_error)) {
    return core::errors::FailWith(error, ErrorKind::kInternal, "fingerprint", hash_error);
  }

  std::array<char, kReadChunkBytes> buffer{};
  std::uint64_t remaining = head_bytes;
  while (remaining > 0U && in_file) {
    const auto want = static_cast<std::streamsize>(
        std::min<std::uint64_t>(remaining, static_cast<std::uint64_t>(buffer.size())));
    in_file.read(buffer.data(), want);
    const std::streamsize got = in_file.gcount();
    if (got <= 0) {
      break;
    }
    if (!hasher.Update(buffer.data(), static_cast<std::size_t>(got), hash_error)) {
      return core::errors::FailWith(error, ErrorKind::kInternal, "fingerprint", hash_error);
    }
    remaining -= static_cast<std::uint64_t>(got);
  }

  if (in_file.bad()) {
    return core::errors::Fail(error, ErrorKind::kIo,
                              "failed while reading measurement file: " + path.string());
  }

  if (!hasher.FinishHex(signature, hash_error)) {
    return core::errors::FailWith(error, ErrorKind::kInternal, "fingerprint", hash_error);
  }
  return true;
}

} // namespace autopsy::store
