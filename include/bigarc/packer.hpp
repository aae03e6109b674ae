#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "archive.hpp"
#include "error.hpp"
#include "source.hpp"
#include "types.hpp"

namespace bigarc {

class Packer {
public:
  Packer() = default;
  ~Packer() = default;

  // Delete copy, enable move
  Packer(const Packer &) = delete;
  Packer &operator=(const Packer &) = delete;
  Packer(Packer &&) noexcept = default;
  Packer &operator=(Packer &&) noexcept = default;

  // Add entry from memory
  void addData(std::span<const uint8_t> data, const std::string &name);

  // Add entry from disk. The length is taken now; the bytes are read when the archive is built.
  // Returns false if the source file does not exist (error in outError if provided)
  bool addFile(const std::filesystem::path &sourcePath, const std::string &name,
               Error *outError = nullptr);

  // Add entry with a caller-supplied source
  void addSource(const std::string &name, std::unique_ptr<ByteSource> source);

  // Recursively add every non-directory entry under root.
  // Entry names are the traversed paths (root joined with the relative path, '/' separated).
  bool addDirectory(const std::filesystem::path &root, Error *outError = nullptr);

  // Compute table layout without copying any entry data
  std::optional<PackLayout> layout(const PackSettings &settings, Error *outError = nullptr) const;

  // Serialize the archive to memory
  std::optional<std::vector<uint8_t>> build(const PackSettings &settings,
                                            Error *outError = nullptr) const;

  // Serialize the archive and wrap it for reading
  std::optional<Archive> buildArchive(const PackSettings &settings,
                                      Error *outError = nullptr) const;

  // Serialize the archive to disk. The bytes go to destPath + ".partial", which is renamed
  // onto destPath only after it is complete and flushed. On failure destPath is untouched.
  bool write(const std::filesystem::path &destPath, const PackSettings &settings,
             Error *outError = nullptr) const;

  // Clear all entries
  void clear() { pending_.clear(); }

  // Get number of entries to be written
  size_t entryCount() const { return pending_.size(); }

private:
  struct PendingEntry {
    std::string name; // Name as added, before prefix stripping
    std::unique_ptr<ByteSource> source;
  };

  // Layout plus the source for each record, in table order
  struct Plan {
    PackLayout layout;
    std::vector<const ByteSource *> sources;
  };

  std::optional<Plan> plan(const PackSettings &settings, Error *outError) const;

  static bool emit(const Plan &plan, const PackSettings &settings, std::span<uint8_t> out,
                   Error *outError);

  std::vector<PendingEntry> pending_;
};

// Pack in-memory (name, bytes) pairs
std::optional<std::vector<uint8_t>>
pack(const std::vector<std::pair<std::string, std::vector<uint8_t>>> &entries,
     const PackSettings &settings, Error *outError = nullptr);

} // namespace bigarc
