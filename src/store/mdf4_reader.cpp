#include "store/mdf4_reader.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <set>
#include <string_view>

namespace autopsy::store {

namespace {

constexpr std::size_t kIdBlockSize = 64;
constexpr std::uint64_t kHeaderBlockOffset = 64;
constexpr std::size_t kBlockHeaderSize = 24;
constexpr std::uint64_t kMaxLinkCount = 4096;
constexpr std::uint64_t kMaxTextBytes = 64 * 1024;
constexpr std::size_t kMaxVisitedBlocks = 1'000'000;

// Link slots used by the walk.
constexpr std::size_t kHdDgFirst = 0;
constexpr std::size_t kDgNext = 0;
constexpr std::size_t kDgCgFirst = 1;
constexpr std::size_t kCgNext = 0;
constexpr std::size_t kCgCnFirst = 1;
constexpr std::size_t kCnNext = 0;
constexpr std::size_t kCnTxName = 2;

std::uint64_t ReadLe64(const unsigned char* p) {
  std::uint64_t value = 0;
  for (int i = 7; i >= 0; --i) {
    value = (value << 8U) | p[i];
  }
  return value;
}

std::uint16_t ReadLe16(const unsigned char* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8U));
}

struct Block {
  std::string id;
  std::uint64_t length = 0;
  std::vector<std::uint64_t> links;
  std::uint64_t data_offset = 0;
};

class BlockReader {
public:
  explicit BlockReader(std::ifstream& input, std::uint64_t file_size)
      : input_(&input), file_size_(file_size) {}

  bool ReadBytes(std::uint64_t offset, std::size_t count, unsigned char* out,
                 std::string& error) {
    if (offset > file_size_ || count > file_size_ - offset) {
      error = "block at offset " + std::to_string(offset) + " extends past end of file";
      return false;
    }
    input_->clear();
    input_->seekg(static_cast<std::streamoff>(offset));
    input_->read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(count));
    if (!(*input_)) {
      error = "failed to read " + std::to_string(count) + " bytes at offset " +
              std::to_string(offset);
      return false;
    }
    return true;
  }

  // Chain blocks are tracked so a cyclic link fails instead of looping. Text
  // blocks may legitimately be shared between channels and are not tracked.
  bool ReadBlock(std::uint64_t offset, std::string_view expected_id, Block& block,
                 std::string& error, bool track_visit = true) {
    if (track_visit && !visited_.insert(offset).second) {
      error = "cyclic block link at offset " + std::to_string(offset);
      return false;
    }
    if (visited_.size() > kMaxVisitedBlocks) {
      error = "block chain exceeds " + std::to_string(kMaxVisitedBlocks) + " blocks";
      return false;
    }

    std::array<unsigned char, kBlockHeaderSize> header{};
    if (!ReadBytes(offset, header.size(), header.data(), error)) {
      return false;
    }
    block.id.assign(reinterpret_cast<const char*>(header.data()), 4);
    if (block.id != expected_id) {
      error = "expected " + std::string(expected_id) + " block at offset " +
              std::to_string(offset) + ", found '" + block.id + "'";
      return false;
    }
    block.length = ReadLe64(header.data() + 8);
    const std::uint64_t link_count = ReadLe64(header.data() + 16);
    if (link_count > kMaxLinkCount || block.length < kBlockHeaderSize + link_count * 8U) {
      error = "malformed " + block.id + " block at offset " + std::to_string(offset);
      return false;
    }

    std::vector<unsigned char> raw_links(static_cast<std::size_t>(link_count) * 8U);
    if (!raw_links.empty() &&
        !ReadBytes(offset + kBlockHeaderSize, raw_links.size(), raw_links.data(), error)) {
      return false;
    }
    block.links.resize(static_cast<std::size_t>(link_count));
    for (std::size_t i = 0; i < block.links.size(); ++i) {
      block.links[i] = ReadLe64(raw_links.data() + i * 8U);
    }
    block.data_offset = offset + kBlockHeaderSize + link_count * 8U;
    return true;
  }

  // Text payload of a ##TX block, up to its first NUL.
  bool ReadText(std::uint64_t offset, std::string& text, std::string& error) {
    Block block;
    if (!ReadBlock(offset, "##TX", block, error, false)) {
      return false;
    }
    const std::uint64_t size =
        std::min<std::uint64_t>(block.length - (block.data_offset - offset), kMaxTextBytes);
    std::vector<unsigned char> raw(static_cast<std::size_t>(size));
    if (!raw.empty() && !ReadBytes(block.data_offset, raw.size(), raw.data(), error)) {
      return false;
    }
    const auto nul = std::find(raw.begin(), raw.end(), static_cast<unsigned char>(0));
    text.assign(raw.begin(), nul);
    return true;
  }

private:
  std::ifstream* input_;
  std::uint64_t file_size_;
  std::set<std::uint64_t> visited_;
};

std::uint64_t LinkAt(const Block& block, std::size_t index) {
  return index < block.links.size() ? block.links[index] : 0U;
}

} // namespace

bool ReadMdf4Summary(const std::filesystem::path& path, Mdf4Summary& summary, std::string& error) {
  summary = Mdf4Summary{};

  std::error_code size_ec;
  const std::uintmax_t file_size = std::filesystem::file_size(path, size_ec);
  if (size_ec) {
    error = "unable to stat MDF file '" + path.string() + "': " + size_ec.message();
    return false;
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open MDF file: " + path.string();
    return false;
  }
  BlockReader reader(input, static_cast<std::uint64_t>(file_size));

  std::array<unsigned char, kIdBlockSize> id_block{};
  if (!reader.ReadBytes(0, id_block.size(), id_block.data(), error)) {
    error = "not an MDF file (identification block truncated): " + path.string();
    return false;
  }
  const std::string_view file_id(reinterpret_cast<const char*>(id_block.data()), 8);
  if (file_id == "UnFinMF ") {
    summary.finalized = false;
  } else if (file_id != "MDF     ") {
    error = "not an MDF file (bad identification '" + std::string(file_id) + "')";
    return false;
  }
  summary.version = ReadLe16(id_block.data() + 28);
  if (summary.version < 400U || summary.version >= 500U) {
    error = "unsupported MDF version " + std::to_string(summary.version);
    return false;
  }

  Block header;
  if (!reader.ReadBlock(kHeaderBlockOffset, "##HD", header, error)) {
    return false;
  }
  std::array<unsigned char, 8> start_raw{};
  if (!reader.ReadBytes(header.data_offset, start_raw.size(), start_raw.data(), error)) {
    return false;
  }
  const std::uint64_t start_time_ns = ReadLe64(start_raw.data());
  if (start_time_ns != 0U) {
    summary.start_time_unix = static_cast<double>(start_time_ns) / 1e9;
  }

  std::set<std::string> names;
  for (std::uint64_t dg_offset = LinkAt(header, kHdDgFirst); dg_offset != 0U;) {
    Block dg;
    if (!reader.ReadBlock(dg_offset, "##DG", dg, error)) {
      return false;
    }
    for (std::uint64_t cg_offset = LinkAt(dg, kDgCgFirst); cg_offset != 0U;) {
      Block cg;
      if (!reader.ReadBlock(cg_offset, "##CG", cg, error)) {
        return false;
      }
      for (std::uint64_t cn_offset = LinkAt(cg, kCgCnFirst); cn_offset != 0U;) {
        Block cn;
        if (!reader.ReadBlock(cn_offset, "##CN", cn, error)) {
          return false;
        }
        const std::uint64_t name_offset = LinkAt(cn, kCnTxName);
        if (name_offset != 0U) {
          std::string name;
          if (!reader.ReadText(name_offset, name, error)) {
            return false;
          }
          if (!name.empty()) {
            names.insert(std::move(name));
          }
        }
        cn_offset = LinkAt(cn, kCnNext);
      }
      cg_offset = LinkAt(cg, kCgNext);
    }
    dg_offset = LinkAt(dg, kDgNext);
  }

  summary.channels.assign(names.begin(), names.end());
  return true;
}

} // namespace autopsy::store
