#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace bigarc {

// std::byteswap arrives in C++23
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

} // namespace detail

// Check if the system is little-endian at compile time
inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Convert big-endian to host byte order
inline constexpr uint32_t fromBigEndian(uint32_t value) noexcept {
  if constexpr (is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Convert host byte order to big-endian
inline constexpr uint32_t toBigEndian(uint32_t value) noexcept {
  if constexpr (is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Convert little-endian to host byte order
inline constexpr uint32_t fromLittleEndian(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Convert host byte order to little-endian
inline constexpr uint32_t toLittleEndian(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Unaligned loads and stores. Callers check bounds.
inline uint32_t loadBE32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, 4);
  return fromBigEndian(value);
}

inline uint32_t loadLE32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, 4);
  return fromLittleEndian(value);
}

inline void storeBE32(uint8_t *dst, uint32_t value) noexcept {
  uint32_t be = toBigEndian(value);
  std::memcpy(dst, &be, 4);
}

inline void storeLE32(uint8_t *dst, uint32_t value) noexcept {
  uint32_t le = toLittleEndian(value);
  std::memcpy(dst, &le, 4);
}

} // namespace bigarc
