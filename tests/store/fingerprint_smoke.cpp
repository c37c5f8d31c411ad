#include "store/fingerprint.hpp"

#include "../common/assertions.hpp"
#include "../common/measurement_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using autopsy::core::errors::Error;
using autopsy::core::errors::ErrorKind;
using autopsy::tests::common::AssertTrue;
using autopsy::tests::common::RequireErrorKind;
using autopsy::tests::common::RequireOk;

namespace {

std::string Fingerprint(const fs::path& path, std::uint64_t head_bytes) {
  std::string signature;
  Error error;
  RequireOk(autopsy::store::FingerprintFile(path, head_bytes, signature, error), error,
            "FingerprintFile");
  AssertTrue(signature.size() == 64U, "signature must be 64 hex chars");
  return signature;
}

// Overwrites one byte in place so the file size never changes.
void PatchByte(const fs::path& path, std::streamoff offset, char value) {
  std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
  if (!file) {
    autopsy::tests::common::Fail("failed to open for patch: " + path.string());
  }
  file.seekp(offset);
  file.put(value);
}

} // namespace

int main() {
  const fs::path root = autopsy::tests::common::CreateUniqueTempDir("autopsy-fingerprint");
  const fs::path file = root / "log.csv";
  autopsy::tests::common::WriteFixtureFile(file, std::string(256, 'x'));

  const fs::file_time_type pinned_mtime = fs::last_write_time(file);
  const std::string baseline = Fingerprint(file, autopsy::store::kDefaultFingerprintHeadBytes);
  AssertTrue(baseline == Fingerprint(file, autopsy::store::kDefaultFingerprintHeadBytes),
             "fingerprint must be stable for an unchanged file");

  // Change inside the head window with size and mtime pinned.
  PatchByte(file, 10, 'y');
  fs::last_write_time(file, pinned_mtime);
  const std::string head_changed = Fingerprint(file, autopsy::store::kDefaultFingerprintHeadBytes);
  AssertTrue(head_changed != baseline, "head edit must change the fingerprint");

  // Change strictly after a 16-byte head window: not detected by design.
  const std::string small_head = Fingerprint(file, 16);
  PatchByte(file, 200, 'z');
  fs::last_write_time(file, pinned_mtime);
  AssertTrue(Fingerprint(file, 16) == small_head,
             "edit beyond the head window with size and mtime pinned is not detected");

  // mtime alone.
  fs::last_write_time(file, pinned_mtime + std::chrono::seconds(5));
  AssertTrue(Fingerprint(file, 16) != small_head, "mtime change must change the fingerprint");

  // size alone.
  fs::last_write_time(file, pinned_mtime);
  {
    std::ofstream append(file, std::ios::binary | std::ios::app);
    append << 'x';
  }
  fs::last_write_time(file, pinned_mtime);
  AssertTrue(Fingerprint(file, 16) != small_head, "size change must change the fingerprint");

  std::string signature;
  Error error;
  RequireErrorKind(autopsy::store::FingerprintFile(root / "absent.csv", signature, error), error,
                   ErrorKind::kIo, "missing file");
  RequireErrorKind(autopsy::store::FingerprintFile(root, signature, error), error, ErrorKind::kIo,
                   "directory path");

  autopsy::tests::common::RemovePathBestEffort(root);
  return 0;
}
