#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pk3 {

// Raw deflate streams (no zlib or gzip wrapper), as stored in ZIP entries.
// Thin layer over zlib.

// Compress `data`. Returns std::nullopt on failure, with error message in outError if provided
std::optional<std::vector<uint8_t>> deflateRaw(std::span<const uint8_t> data,
                                               std::string *outError = nullptr);

// Decompress `compressed`, which must inflate to exactly `expectedSize` bytes
std::optional<std::vector<uint8_t>> inflateRaw(std::span<const uint8_t> compressed,
                                               size_t expectedSize,
                                               std::string *outError = nullptr);

// CRC-32 as used by ZIP (same polynomial as zlib's crc32)
uint32_t crc32(std::span<const uint8_t> data);

} // namespace pk3
