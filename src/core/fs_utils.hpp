#ifndef AUTOPSY_CORE_FS_UTILS_HPP_
#define AUTOPSY_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace autopsy::core {

// Unique sibling path for staging an artifact before publish. The pid keeps
// concurrent producers in different processes from sharing a staging file.
inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(::getpid()) + "." +
         std::to_string(tick) + "." + std::to_string(suffix);
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Moves a fully written staging file into its final location.
//
// rename(2) replaces the destination atomically, so readers observe either the
// previous artifact or the complete new one. Two producers racing on the same
// key both publish complete files and the last rename wins. The staging file is
// removed when publish fails.
inline bool PublishStagedFile(const std::filesystem::path& temp_path,
                              const std::filesystem::path& output_path, std::string& error) {
  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// Atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    out_file.flush();
    if (!out_file) {
      out_file.close();
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  return PublishStagedFile(temp_path, output_path, error);
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read text file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading text file: " + path.string();
    return false;
  }
  return true;
}

} // namespace autopsy::core

#endif // AUTOPSY_CORE_FS_UTILS_HPP_
