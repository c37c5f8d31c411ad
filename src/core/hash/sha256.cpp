#include "core/hash/sha256.hpp"

#include <openssl/evp.h>

#include <array>

namespace autopsy::core::hash {

namespace {

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX* context) const {
    EVP_MD_CTX_free(context);
  }
};

constexpr char kHexDigits[] = "0123456789abcdef";

} // namespace

struct Sha256Hasher::Impl {
  std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> context;
  bool ready = false;
  bool finished = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
  impl_->context.reset(EVP_MD_CTX_new());
  if (impl_->context != nullptr) {
    impl_->ready = EVP_DigestInit_ex(impl_->context.get(), EVP_sha256(), nullptr) == 1;
  }
}

Sha256Hasher::~Sha256Hasher() = default;

bool Sha256Hasher::Update(const void* data, const std::size_t size, std::string& error) {
  if (!impl_->ready || impl_->finished) {
    error = "sha256 context is not usable (init failed or digest already finished)";
    return false;
  }
  if (size == 0U) {
    return true;
  }
  if (EVP_DigestUpdate(impl_->context.get(), data, size) != 1) {
    error = "sha256 update failed";
    return false;
  }
  return true;
}

bool Sha256Hasher::FinishHex(std::string& hex_digest, std::string& error) {
  if (!impl_->ready || impl_->finished) {
    error = "sha256 context is not usable (init failed or digest already finished)";
    return false;
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_size = 0;
  if (EVP_DigestFinal_ex(impl_->context.get(), digest.data(), &digest_size) != 1) {
    error = "sha256 finalize failed";
    return false;
  }
  impl_->finished = true;

  hex_digest.clear();
  hex_digest.reserve(static_cast<std::size_t>(digest_size) * 2U);
  for (unsigned int i = 0; i < digest_size; ++i) {
    hex_digest.push_back(kHexDigits[(digest[i] >> 4U) & 0x0FU]);
    hex_digest.push_back(kHexDigits[digest[i] & 0x0FU]);
  }
  return true;
}

bool Sha256Hex(std::string_view data, std::string& hex_digest, std::string& error) {
  Sha256Hasher hasher;
  return hasher.Update(data, error) && hasher.FinishHex(hex_digest, error);
}

} // namespace autopsy::core::hash
