#pragma once

#include "core/json_dom.hpp"

#include <cstddef>
#include <string>

namespace autopsy::store {

inline constexpr std::size_t kConfigKeyLength = 16;

// Canonical text form of a configuration: object keys sorted, no whitespace,
// shortest round-trip numbers. Arrays are kept verbatim, so callers that treat
// a list as a set must normalize it before building the value.
std::string CanonicalJson(const core::json::Value& config);

// Short stable cache key: first 16 hex chars of SHA-256(CanonicalJson(config)).
// Pure function of the configuration; stable across calls and processes.
bool ConfigKey(const core::json::Value& config, std::string& key, std::string& error);

} // namespace autopsy::store
