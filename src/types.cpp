#include <cstring>

#include <bigarc/types.hpp>

namespace bigarc {

std::optional<Kind> kindFromMagic(std::span<const uint8_t> bytes) {
  if (bytes.size() != 4) {
    return std::nullopt;
  }
  if (std::memcmp(bytes.data(), "BIG4", 4) == 0) {
    return Kind::Big4;
  }
  if (std::memcmp(bytes.data(), "BIGF", 4) == 0) {
    return Kind::BigF;
  }
  return std::nullopt;
}

std::string_view kindMagic(Kind kind) {
  switch (kind) {
  case Kind::Big4:
    return "BIG4";
  case Kind::BigF:
    return "BIGF";
  }
  return {};
}

size_t tableSize(const EntryTable &table) {
  size_t size = 0;
  for (const auto &[name, record] : table) {
    size += record.recordSize();
  }
  return size;
}

size_t tableSize(std::span<const EntryRecord> records) {
  size_t size = 0;
  for (const auto &record : records) {
    size += record.recordSize();
  }
  return size;
}

} // namespace bigarc
