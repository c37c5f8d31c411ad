#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace autopsy::core::hash {

// Incremental SHA-256 backed by OpenSSL's EVP digest API.
//
// Contract:
// - `Update` may be called any number of times before `FinishHex`.
// - `FinishHex` returns the lowercase 64-char hex digest and resets nothing;
//   the hasher must not be reused afterwards.
// - any OpenSSL failure is reported through `error` and a false return.
class Sha256Hasher {
public:
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  bool Update(const void* data, std::size_t size, std::string& error);
  bool Update(std::string_view text, std::string& error) {
    return Update(text.data(), text.size(), error);
  }

  bool FinishHex(std::string& hex_digest, std::string& error);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// One-shot digest of an in-memory buffer.
bool Sha256Hex(std::string_view data, std::string& hex_digest, std::string& error);

} // namespace autopsy::core::hash
