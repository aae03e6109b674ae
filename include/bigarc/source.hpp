#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"

namespace bigarc {

// Something the packer can copy entry bytes from.
// length() is known up front; copyTo() is called once, with a span of exactly length() bytes.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual uint64_t length() const = 0;

  // On failure fills outError; `name` is the entry name used in error reports
  virtual bool copyTo(std::span<uint8_t> dest, const std::string &name,
                      Error *outError) const = 0;
};

// Bytes held in memory
class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}
  explicit MemorySource(std::span<const uint8_t> data) : data_(data.begin(), data.end()) {}

  uint64_t length() const override { return data_.size(); }

  bool copyTo(std::span<uint8_t> dest, const std::string &name,
              Error *outError) const override;

private:
  std::vector<uint8_t> data_;
};

// File on disk. The length is recorded at discovery; the file is opened only when copied.
class FileSource : public ByteSource {
public:
  FileSource(std::filesystem::path path, uint64_t length)
      : path_(std::move(path)), length_(length) {}

  uint64_t length() const override { return length_; }

  bool copyTo(std::span<uint8_t> dest, const std::string &name,
              Error *outError) const override;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  uint64_t length_ = 0;
};

} // namespace bigarc
