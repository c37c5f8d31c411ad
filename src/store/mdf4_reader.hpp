#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace autopsy::store {

inline constexpr std::size_t kMaxListedChannels = 2000;

// Header-level summary of an ASAM MDF 4.x file.
struct Mdf4Summary {
  // Numeric version from the identification block, e.g. 410 for 4.10.
  std::uint16_t version = 0;
  bool finalized = true;
  std::optional<double> start_time_unix;
  // Sorted, de-duplicated channel names.
  std::vector<std::string> channels;
};

// Reads the identification block, the header block, and channel names by
// walking the DG -> CG -> CN link chain. Sample data is never touched.
//
// Only MDF version 4.x is understood. Cycles and runaway chains are cut off by
// a visited-block set and a block count limit. Any malformed block is an error.
bool ReadMdf4Summary(const std::filesystem::path& path, Mdf4Summary& summary, std::string& error);

} // namespace autopsy::store
