#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "error.hpp"

namespace bigarc {

// Read-only view into a shared buffer.
// Holds a reference to the buffer, so the bytes stay valid for as long as the view exists.
class ByteView {
public:
  ByteView() = default;
  ByteView(std::shared_ptr<const void> owner, std::span<const uint8_t> bytes)
      : owner_(std::move(owner)), bytes_(bytes) {}

  const uint8_t *data() const { return bytes_.data(); }
  size_t size() const { return bytes_.size(); }
  bool empty() const { return bytes_.empty(); }

  auto begin() const { return bytes_.begin(); }
  auto end() const { return bytes_.end(); }

  uint8_t operator[](size_t index) const { return bytes_[index]; }

  std::span<const uint8_t> span() const { return bytes_; }

  std::vector<uint8_t> toVector() const { return std::vector<uint8_t>(bytes_.begin(), bytes_.end()); }

private:
  std::shared_ptr<const void> owner_;
  std::span<const uint8_t> bytes_;
};

// Reference-counted, immutable byte buffer.
// Backed either by a read-only memory mapping or by an owned vector.
// Copies share the same bytes.
class SharedBuffer {
public:
  SharedBuffer() = default;

  // Map a file read-only
  static std::optional<SharedBuffer> mapFile(const std::filesystem::path &path,
                                             Error *outError = nullptr);

  // Take ownership of bytes
  static SharedBuffer fromVector(std::vector<uint8_t> bytes);

  // Copy bytes once into a new buffer
  static SharedBuffer copyOf(std::span<const uint8_t> bytes);

  std::span<const uint8_t> data() const { return data_; }
  size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  // Number of handles (buffers and views) sharing these bytes
  long useCount() const { return owner_.use_count(); }

  // View of [offset, offset + length). Callers check bounds.
  ByteView view(size_t offset, size_t length) const {
    return ByteView(owner_, data_.subspan(offset, length));
  }

private:
  SharedBuffer(std::shared_ptr<const void> owner, std::span<const uint8_t> data)
      : owner_(std::move(owner)), data_(data) {}

  std::shared_ptr<const void> owner_;
  std::span<const uint8_t> data_;
};

} // namespace bigarc
