#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace pk3 {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint16_t byteswap(uint16_t value) noexcept {
  return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

} // namespace detail

// Check if the system is big-endian at compile time
inline constexpr bool is_big_endian() noexcept {
  return std::endian::native == std::endian::big;
}

// ZIP stores every multi-byte field little-endian

inline constexpr uint16_t fromLittle16(uint16_t value) noexcept {
  if constexpr (is_big_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint32_t fromLittle32(uint32_t value) noexcept {
  if constexpr (is_big_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

inline constexpr uint16_t toLittle16(uint16_t value) noexcept {
  return fromLittle16(value);
}

inline constexpr uint32_t toLittle32(uint32_t value) noexcept {
  return fromLittle32(value);
}

// Unaligned reads/writes at a raw byte position. Callers check bounds.

inline uint16_t load16(const uint8_t *src) noexcept {
  uint16_t value;
  std::memcpy(&value, src, sizeof(value));
  return fromLittle16(value);
}

inline uint32_t load32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, sizeof(value));
  return fromLittle32(value);
}

inline void store16(uint8_t *dst, uint16_t value) noexcept {
  value = toLittle16(value);
  std::memcpy(dst, &value, sizeof(value));
}

inline void store32(uint8_t *dst, uint32_t value) noexcept {
  value = toLittle32(value);
  std::memcpy(dst, &value, sizeof(value));
}

} // namespace pk3
