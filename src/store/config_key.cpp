#include "store/config_key.hpp"

#include "core/hash/sha256.hpp"

namespace autopsy::store {

std::string CanonicalJson(const core::json::Value& config) {
  return core::json::Serialize(config, /*indent=*/0);
}

bool ConfigKey(const core::json::Value& config, std::string& key, std::string& error) {
  key.clear();
  std::string digest;
  if (!core::hash::Sha256Hex(CanonicalJson(config), digest, error)) {
    error = "failed to hash configuration: " + error;
    return false;
  }
  key = digest.substr(0, kConfigKeyLength);
  return true;
}

} // namespace autopsy::store
