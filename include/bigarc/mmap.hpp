#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

#include "error.hpp"

namespace bigarc {

// Memory-mapped archive file. Readers map an existing archive read-only;
// the packer maps a freshly sized output file and fills it in place.
class MappedFile {
public:
  enum class Access { Read, Write };

  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map an existing file. Empty files are rejected with AttemptCreateEmpty,
  // every other failure is Io. error.name carries the path.
  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  // Create (or truncate) path, size it to exactly size bytes and map it writable.
  // If sizing or mapping fails the created file is removed again.
  bool openWrite(const std::filesystem::path &path, size_t size, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return {static_cast<const uint8_t *>(data_), size_};
  }
  std::span<uint8_t> data() { return {static_cast<uint8_t *>(data_), size_}; }

  // Push written bytes to disk. Only valid for Access::Write.
  bool flush(Error *outError = nullptr);

  void close();

  // Close a write mapping and delete the file it created
  void discard();

  bool isOpen() const { return data_ != nullptr; }
  size_t size() const { return size_; }
  Access access() const { return access_; }
  const std::filesystem::path &path() const { return path_; }

private:
  // Record a failure for the current path and release everything opened so far
  bool fail(Error *outError, ErrorCode code, std::string_view what, bool withSystemError = true);
  // As fail(), then delete the file openWrite() created
  bool failCreated(Error *outError, std::string_view what);
  void release() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;
  void *mappingHandle_ = nullptr;
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  Access access_ = Access::Read;
  std::filesystem::path path_;
};

} // namespace bigarc
