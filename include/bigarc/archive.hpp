#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "buffer.hpp"
#include "error.hpp"
#include "types.hpp"

namespace bigarc {

// Decoded view over one immutable archive buffer.
//
// Construction performs no validation; each read_ call decodes what it needs straight from
// the buffer and reports malformed input through outError. All reads are const and keep
// no cursor, so an Archive can be read from several threads at once.
class Archive {
public:
  Archive() = default;

  // Memory-map an archive file
  static std::optional<Archive> open(const std::filesystem::path &path,
                                     Error *outError = nullptr);

  // Copy bytes into a new shared buffer
  static std::optional<Archive> fromBytes(std::span<const uint8_t> bytes,
                                          Error *outError = nullptr);

  // Share an existing buffer
  static std::optional<Archive> fromBuffer(SharedBuffer buffer, Error *outError = nullptr);

  // Header fields
  std::optional<Kind> readKind(Error *outError = nullptr) const;
  std::optional<uint32_t> readTotalSize(Error *outError = nullptr) const;
  std::optional<uint32_t> readEntryCount(Error *outError = nullptr) const;
  std::optional<uint32_t> readDataStart(Error *outError = nullptr) const;

  // Entry table as a name lookup (later duplicates replace earlier ones)
  std::optional<EntryTable> readEntryTable(Error *outError = nullptr) const;

  // Entry records in table order, duplicates kept
  std::optional<std::vector<EntryRecord>> readEntryList(Error *outError = nullptr) const;

  // Bytes between the end of the table and data_start.
  // Returns std::nullopt with outError cleared if there are none.
  // The table end is recomputed from `table`, which holds one record per name. In an archive
  // with duplicate names the records dropped from the table are reported as secret data.
  std::optional<ByteView> readSecretData(const EntryTable &table,
                                         Error *outError = nullptr) const;

  // Lookup by exact name, nullptr if absent
  static const EntryRecord *findEntry(const EntryTable &table, std::string_view name);

  // Bounds-checked view of an entry's bytes
  std::optional<ByteView> entryBytes(const EntryRecord &record, Error *outError = nullptr) const;

  // Bytes of the named entry.
  // Returns std::nullopt with outError cleared if the name is not in the table.
  std::optional<ByteView> bytesOf(const EntryTable &table, std::string_view name,
                                  Error *outError = nullptr) const;

  // Path for entry `name` under outputDir. Backslashes count as separators. Names that are
  // absolute, carry a root name, or climb above outputDir after normalization fail with
  // OutOfBounds naming the entry.
  static std::optional<std::filesystem::path> destinationFor(
      const std::filesystem::path &outputDir, std::string_view name, Error *outError = nullptr);

  // Extract entry to disk, creating parent directories
  bool extract(const EntryRecord &record, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  // Extract entry to memory
  std::optional<std::vector<uint8_t>> extractToMemory(const EntryRecord &record,
                                                      Error *outError = nullptr) const;

  // Whole archive, e.g. for persisting an in-memory archive
  std::span<const uint8_t> data() const { return buffer_.data(); }
  size_t size() const { return buffer_.size(); }

  const SharedBuffer &buffer() const { return buffer_; }

  bool isOpen() const { return !buffer_.empty(); }

private:
  explicit Archive(SharedBuffer buffer) : buffer_(std::move(buffer)) {}

  std::optional<uint32_t> readHeaderField(size_t offset, bool bigEndian, const char *field,
                                          Error *outError) const;

  // Decode records in table order, invoking sink for each
  template <typename Sink>
  bool decodeTable(Sink &&sink, Error *outError) const;

  SharedBuffer buffer_;
};

} // namespace bigarc
