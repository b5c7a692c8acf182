#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pk3 {

// Entry in a ZIP archive, as described by its central directory record
struct FileEntry {
  std::string path;                 // Stored name, byte-for-byte (no normalization)
  uint16_t flags = 0;               // General purpose bit flags
  uint16_t method = 0;              // 0 = stored, 8 = deflate
  uint16_t modTime = 0;             // MS-DOS time
  uint16_t modDate = 0;             // MS-DOS date
  uint32_t crc32 = 0;               // CRC-32 of the uncompressed data
  uint32_t compressedSize = 0;      // Size of the stored data
  uint32_t size = 0;                // Uncompressed size in bytes
  uint32_t externalAttributes = 0;  // Host attributes (unix mode in the high word)
  uint32_t localHeaderOffset = 0;   // Offset of the local file header

  bool isDirectory() const { return !path.empty() && path.back() == '/'; }
  bool isEncrypted() const { return (flags & 0x0001) != 0; }
};

// On-disk record layouts (all fields little-endian)
namespace zip {

inline constexpr uint32_t localHeaderSignature = 0x04034B50;
inline constexpr uint32_t centralHeaderSignature = 0x02014B50;
inline constexpr uint32_t endOfDirectorySignature = 0x06054B50;
inline constexpr uint32_t zip64LocatorSignature = 0x07064B50;

inline constexpr size_t localHeaderSize = 30;
inline constexpr size_t centralHeaderSize = 46;
inline constexpr size_t endOfDirectorySize = 22;
inline constexpr size_t zip64LocatorSize = 20;
inline constexpr size_t maxCommentSize = 0xFFFF;

inline constexpr uint16_t methodStored = 0;
inline constexpr uint16_t methodDeflate = 8;

inline constexpr uint16_t flagUtf8 = 0x0800;

inline constexpr uint16_t versionNeeded = 20;          // 2.0: deflate, directories
inline constexpr uint16_t versionMadeBy = (3 << 8) | 20; // unix, 2.0

inline constexpr uint32_t maxEntries = 0xFFFF;
inline constexpr uint32_t maxField32 = 0xFFFFFFFF;

} // namespace zip

// Failure categories reported by the archive layer and the swap engine
enum class ErrorKind {
  None,
  NotFound,        // Expected file missing
  Format,          // Bytes are not a readable ZIP archive
  IO,              // Copy, delete, rename, map or write failure
  InvalidArgument, // Rejected configuration
  AlreadyExists,   // Backup present and the policy refuses to overwrite it
};

std::string_view toString(ErrorKind kind);

} // namespace pk3
