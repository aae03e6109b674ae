#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bigarc {

// Archive sub-format, identified by the 4-byte magic
enum class Kind : uint8_t {
  Big4,
  BigF,
};

// Returns std::nullopt if the bytes are not a known magic
std::optional<Kind> kindFromMagic(std::span<const uint8_t> bytes);

// 4-character tag for kind, or an empty view for an unknown value
std::string_view kindMagic(Kind kind);

// Single record of the entry table
struct EntryRecord {
  uint32_t offset = 0; // Absolute offset of the entry data (big-endian when stored)
  uint32_t length = 0; // Entry data length in bytes (big-endian when stored)
  std::string name;    // NUL-terminated when stored

  // Bytes this record occupies in the table
  size_t recordSize() const { return 8 + name.size() + 1; }
};

// Name -> record lookup. A later record with the same name replaces an earlier one.
using EntryTable = std::unordered_map<std::string, EntryRecord>;

// Archive header (16 bytes)
//
//   0  magic        4 bytes, "BIG4" or "BIGF"
//   4  total_size   u32 little-endian
//   8  entry_count  u32 big-endian
//   12 data_start   u32 big-endian
struct ArchiveHeader {
  static constexpr size_t headerSize = 16;
  static constexpr size_t magicOffset = 0;
  static constexpr size_t totalSizeOffset = 4;
  static constexpr size_t entryCountOffset = 8;
  static constexpr size_t dataStartOffset = 12;
};

// Order in which the packer lays out entries
enum class EntryOrder : uint8_t {
  Path,          // Bytewise lexicographic by stored name
  SizeAscending, // Smallest entry first
};

struct PackSettings {
  EntryOrder ordering = EntryOrder::Path;
  std::optional<std::string> stripPrefix; // Literal prefix removed from each name
  Kind kind = Kind::BigF;
  std::optional<std::vector<uint8_t>> secretData; // Written between table and data_start
};

// Table layout computed by the packer
struct PackLayout {
  std::vector<EntryRecord> records; // In table order
  uint32_t tableSize = 0;
  uint32_t dataStart = 0;
  uint32_t totalSize = 0;
};

// Size of the entry table described by the given records
size_t tableSize(const EntryTable &table);
size_t tableSize(std::span<const EntryRecord> records);

} // namespace bigarc
