#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>

#include <spdlog/spdlog.h>

#include <bigarc/archive.hpp>
#include <bigarc/endian.hpp>

namespace bigarc {

namespace {

constexpr const char *kReplacementChar = "\xEF\xBF\xBD"; // U+FFFD

// Decode UTF-8, replacing each maximal invalid subsequence with U+FFFD
std::string decodeLossyUtf8(const uint8_t *bytes, size_t length) {
  std::string result;
  result.reserve(length);

  size_t i = 0;
  while (i < length) {
    uint8_t lead = bytes[i];
    if (lead < 0x80) {
      result += static_cast<char>(lead);
      ++i;
      continue;
    }

    size_t continuation = 0;
    uint8_t low = 0x80;
    uint8_t high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      continuation = 1;
    } else if (lead == 0xE0) {
      continuation = 2;
      low = 0xA0;
    } else if (lead == 0xED) {
      continuation = 2;
      high = 0x9F;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
      continuation = 2;
    } else if (lead == 0xF0) {
      continuation = 3;
      low = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
      continuation = 3;
    } else if (lead == 0xF4) {
      continuation = 3;
      high = 0x8F;
    } else {
      result += kReplacementChar;
      ++i;
      continue;
    }

    // Only the first continuation byte has a narrowed range
    size_t j = 1;
    for (; j <= continuation && i + j < length; ++j) {
      uint8_t c = bytes[i + j];
      uint8_t lo = (j == 1) ? low : 0x80;
      uint8_t hi = (j == 1) ? high : 0xBF;
      if (c < lo || c > hi) {
        break;
      }
    }

    if (j > continuation) {
      result.append(reinterpret_cast<const char *>(bytes + i), continuation + 1);
      i += continuation + 1;
    } else {
      result += kReplacementChar;
      i += j;
    }
  }

  return result;
}

std::string printableMagic(std::span<const uint8_t> bytes) {
  std::string result;
  for (uint8_t b : bytes) {
    if (b >= 0x20 && b < 0x7F) {
      result += static_cast<char>(b);
    } else {
      result += std::format("\\x{:02x}", b);
    }
  }
  return result;
}

} // namespace

std::optional<Archive> Archive::open(const std::filesystem::path &path, Error *outError) {
  auto buffer = SharedBuffer::mapFile(path, outError);
  if (!buffer) {
    return std::nullopt;
  }

  spdlog::debug("Mapped archive {} ({} bytes)", path.string(), buffer->size());
  return Archive(std::move(*buffer));
}

std::optional<Archive> Archive::fromBytes(std::span<const uint8_t> bytes, Error *outError) {
  if (bytes.empty()) {
    detail::setError(outError, ErrorCode::AttemptCreateEmpty,
                     "Cannot create an archive from an empty buffer");
    return std::nullopt;
  }
  return Archive(SharedBuffer::copyOf(bytes));
}

std::optional<Archive> Archive::fromBuffer(SharedBuffer buffer, Error *outError) {
  if (buffer.empty()) {
    detail::setError(outError, ErrorCode::AttemptCreateEmpty,
                     "Cannot create an archive from an empty buffer");
    return std::nullopt;
  }
  return Archive(std::move(buffer));
}

std::optional<Kind> Archive::readKind(Error *outError) const {
  auto data = buffer_.data();
  if (data.size() < 4) {
    detail::setError(outError, ErrorCode::TruncatedHeader,
                     std::format("Archive too small to hold magic (size: {})", data.size()));
    return std::nullopt;
  }

  auto magic = data.first(4);
  auto kind = kindFromMagic(magic);
  if (!kind) {
    detail::setError(outError, ErrorCode::InvalidMagic,
                     std::format("Invalid BIG magic (expected 'BIG4' or 'BIGF', got '{}')",
                                 printableMagic(magic)));
    if (outError) {
      outError->magic.assign(magic.begin(), magic.end());
    }
    return std::nullopt;
  }
  return kind;
}

std::optional<uint32_t> Archive::readHeaderField(size_t offset, bool bigEndian, const char *field,
                                                 Error *outError) const {
  auto data = buffer_.data();
  if (data.size() < offset + 4) {
    detail::setError(outError, ErrorCode::TruncatedHeader,
                     std::format("Archive too small to hold {} (size: {}, needed: {})", field,
                                 data.size(), offset + 4));
    return std::nullopt;
  }
  return bigEndian ? loadBE32(data.data() + offset) : loadLE32(data.data() + offset);
}

std::optional<uint32_t> Archive::readTotalSize(Error *outError) const {
  return readHeaderField(ArchiveHeader::totalSizeOffset, false, "total size", outError);
}

std::optional<uint32_t> Archive::readEntryCount(Error *outError) const {
  return readHeaderField(ArchiveHeader::entryCountOffset, true, "entry count", outError);
}

std::optional<uint32_t> Archive::readDataStart(Error *outError) const {
  return readHeaderField(ArchiveHeader::dataStartOffset, true, "data start", outError);
}

template <typename Sink>
bool Archive::decodeTable(Sink &&sink, Error *outError) const {
  auto entryCount = readEntryCount(outError);
  if (!entryCount) {
    return false;
  }

  auto data = buffer_.data();
  size_t pos = ArchiveHeader::headerSize;

  for (uint32_t i = 0; i < *entryCount; ++i) {
    // offset (4) + length (4)
    if (pos + 8 > data.size()) {
      detail::setError(outError, ErrorCode::TruncatedTable,
                       std::format("Entry record {} extends beyond archive bounds (pos={}, "
                                   "size={})",
                                   i, pos, data.size()));
      return false;
    }

    EntryRecord record;
    record.offset = loadBE32(data.data() + pos);
    record.length = loadBE32(data.data() + pos + 4);
    pos += 8;

    // NUL-terminated name
    const uint8_t *nameStart = data.data() + pos;
    const void *nul = std::memchr(nameStart, '\0', data.size() - pos);
    if (!nul) {
      detail::setError(outError, ErrorCode::TruncatedName,
                       std::format("Entry record {} has an unterminated name", i));
      return false;
    }

    size_t nameLen = static_cast<const uint8_t *>(nul) - nameStart;
    record.name = decodeLossyUtf8(nameStart, nameLen);
    pos += nameLen + 1;

    sink(std::move(record));
  }

  return true;
}

std::optional<EntryTable> Archive::readEntryTable(Error *outError) const {
  EntryTable table;
  bool ok = decodeTable(
      [&table](EntryRecord &&record) {
        auto it = table.find(record.name);
        if (it != table.end()) {
          spdlog::warn("Duplicate entry name in archive, later record wins: {}", record.name);
          it->second = std::move(record);
        } else {
          std::string key = record.name;
          table.emplace(std::move(key), std::move(record));
        }
      },
      outError);

  if (!ok) {
    return std::nullopt;
  }
  return table;
}

std::optional<std::vector<EntryRecord>> Archive::readEntryList(Error *outError) const {
  std::vector<EntryRecord> records;
  bool ok =
      decodeTable([&records](EntryRecord &&record) { records.push_back(std::move(record)); },
                  outError);

  if (!ok) {
    return std::nullopt;
  }
  return records;
}

std::optional<ByteView> Archive::readSecretData(const EntryTable &table, Error *outError) const {
  auto dataStart = readDataStart(outError);
  if (!dataStart) {
    return std::nullopt;
  }

  if (*dataStart > buffer_.size()) {
    detail::setError(outError, ErrorCode::OutOfBounds,
                     std::format("Data start {} is beyond the end of the archive (size: {})",
                                 *dataStart, buffer_.size()));
    return std::nullopt;
  }

  size_t secretOffset = ArchiveHeader::headerSize + tableSize(table);
  if (secretOffset == *dataStart) {
    detail::clearError(outError);
    return std::nullopt;
  }

  if (secretOffset > *dataStart) {
    detail::setError(outError, ErrorCode::OutOfBounds,
                     std::format("Entry table ends at {}, past data start {}", secretOffset,
                                 *dataStart));
    return std::nullopt;
  }

  return buffer_.view(secretOffset, *dataStart - secretOffset);
}

const EntryRecord *Archive::findEntry(const EntryTable &table, std::string_view name) {
  auto it = table.find(std::string(name));
  if (it == table.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<ByteView> Archive::entryBytes(const EntryRecord &record, Error *outError) const {
  uint64_t end = static_cast<uint64_t>(record.offset) + record.length;
  if (end > buffer_.size()) {
    detail::setError(outError, ErrorCode::OutOfBounds,
                     std::format("Entry {} has invalid bounds (offset={}, length={}, "
                                 "archiveSize={})",
                                 record.name, record.offset, record.length, buffer_.size()),
                     record.name);
    return std::nullopt;
  }
  return buffer_.view(record.offset, record.length);
}

std::optional<ByteView> Archive::bytesOf(const EntryTable &table, std::string_view name,
                                         Error *outError) const {
  const EntryRecord *record = findEntry(table, name);
  if (!record) {
    detail::clearError(outError);
    return std::nullopt;
  }
  return entryBytes(*record, outError);
}

std::optional<std::filesystem::path>
Archive::destinationFor(const std::filesystem::path &outputDir, std::string_view name,
                        Error *outError) {
  std::string relativeName(name);
  std::replace(relativeName.begin(), relativeName.end(), '\\', '/');

  std::filesystem::path relative = std::filesystem::path(relativeName).lexically_normal();
  bool escapes = relative.empty() || relative.is_absolute() || relative.has_root_name() ||
                 relative.has_root_directory() || *relative.begin() == "." ||
                 *relative.begin() == "..";
  if (escapes) {
    detail::setError(outError, ErrorCode::OutOfBounds,
                     std::format("Entry name {} points outside {}", std::string(name),
                                 outputDir.string()),
                     std::string(name));
    return std::nullopt;
  }

  return outputDir / relative;
}

bool Archive::extract(const EntryRecord &record, const std::filesystem::path &destPath,
                      Error *outError) const {
  auto bytes = entryBytes(record, outError);
  if (!bytes) {
    return false;
  }

  // Create parent directories if needed
  if (destPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      detail::setError(outError, ErrorCode::Io,
                       std::format("Failed to create directory {}: {}",
                                   destPath.parent_path().string(), ec.message()),
                       record.name);
      return false;
    }
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to create output file: {}", destPath.string()),
                     record.name);
    return false;
  }

  out.write(reinterpret_cast<const char *>(bytes->data()),
            static_cast<std::streamsize>(bytes->size()));
  if (!out) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to write to output file: {}", destPath.string()),
                     record.name);
    return false;
  }

  return true;
}

std::optional<std::vector<uint8_t>> Archive::extractToMemory(const EntryRecord &record,
                                                             Error *outError) const {
  auto bytes = entryBytes(record, outError);
  if (!bytes) {
    return std::nullopt;
  }
  return bytes->toVector();
}

} // namespace bigarc
