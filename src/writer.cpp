#include <algorithm>
#include <cstring>

#include <fmt/format.h>
#include <fmt/std.h>

#include <pk3/deflate.hpp>
#include <pk3/endian.hpp>
#include <pk3/mmap.hpp>
#include <pk3/writer.hpp>

namespace pk3 {

namespace {

constexpr uint32_t regularFileAttributes = 0100644u << 16;
constexpr uint32_t directoryAttributes = (040755u << 16) | 0x10; // 0x10: MS-DOS directory bit

bool hasNonAsciiByte(const std::string &name) {
  return std::any_of(name.begin(), name.end(),
                     [](char c) { return static_cast<unsigned char>(c) >= 0x80; });
}

} // namespace

bool Writer::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                     std::string *outError) {
  FileEntry entry;
  entry.path = archivePath;
  entry.externalAttributes = entry.isDirectory() ? directoryAttributes : regularFileAttributes;
  toDosDateTime(std::time(nullptr), entry.modTime, entry.modDate);
  if (hasNonAsciiByte(entry.path)) {
    entry.flags |= zip::flagUtf8;
  }
  return enqueue(std::move(entry), data, outError);
}

bool Writer::addEntry(const FileEntry &source, std::span<const uint8_t> data,
                      std::string *outError) {
  FileEntry entry;
  entry.path = source.path;
  // The name is copied byte for byte, so it keeps the encoding the source declared
  entry.flags = source.flags & zip::flagUtf8;
  entry.modTime = source.modTime;
  entry.modDate = source.modDate;
  entry.externalAttributes = source.externalAttributes;
  return enqueue(std::move(entry), data, outError);
}

bool Writer::enqueue(FileEntry entry, std::span<const uint8_t> data, std::string *outError) {
  if (entry.path.empty()) {
    if (outError) {
      *outError = "Entry name must not be empty";
    }
    return false;
  }

  if (entry.path.size() > 0xFFFF) {
    if (outError) {
      *outError = fmt::format("Entry name too long ({} bytes): {}...", entry.path.size(),
                              entry.path.substr(0, 64));
    }
    return false;
  }

  if (pendingFiles_.size() >= zip::maxEntries) {
    if (outError) {
      *outError = fmt::format("Too many entries for a non-ZIP64 archive (limit {}) at {}",
                              zip::maxEntries, entry.path);
    }
    return false;
  }

  if (data.size() > zip::maxField32) {
    if (outError) {
      *outError = fmt::format("Entry too large for a non-ZIP64 archive: {} ({} bytes)",
                              entry.path, data.size());
    }
    return false;
  }

  entry.crc32 = crc32(data);
  entry.size = static_cast<uint32_t>(data.size());

  PendingFile pending;
  if (!data.empty()) {
    std::string error;
    auto compressed = deflateRaw(data, &error);
    if (!compressed) {
      if (outError) {
        *outError = fmt::format("Failed to compress {}: {}", entry.path, error);
      }
      return false;
    }
    if (compressed->size() < data.size()) {
      entry.method = zip::methodDeflate;
      pending.payload = std::move(*compressed);
    }
  }

  // Empty or incompressible data is stored verbatim
  if (entry.method != zip::methodDeflate) {
    entry.method = zip::methodStored;
    pending.payload.assign(data.begin(), data.end());
  }

  entry.compressedSize = static_cast<uint32_t>(pending.payload.size());
  pending.entry = std::move(entry);
  pendingFiles_.push_back(std::move(pending));

  return true;
}

bool Writer::write(const std::filesystem::path &destPath, std::string *outError) {
  // Step 1: Calculate layout (local headers + data, then central directory, then end record)
  uint64_t dataSectionSize = 0;
  uint64_t directorySize = 0;

  for (const auto &pending : pendingFiles_) {
    dataSectionSize += zip::localHeaderSize + pending.entry.path.size() + pending.payload.size();
    directorySize += zip::centralHeaderSize + pending.entry.path.size();
  }

  if (dataSectionSize > zip::maxField32 || directorySize > zip::maxField32) {
    if (outError) {
      *outError = fmt::format("Archive too large for the non-ZIP64 format: {}", destPath);
    }
    return false;
  }

  uint64_t totalSize = dataSectionSize + directorySize + zip::endOfDirectorySize;

  // Step 2: Create memory-mapped file
  MappedFile outputFile;
  if (!outputFile.create(destPath, static_cast<size_t>(totalSize), outError)) {
    return false;
  }

  uint8_t *out = outputFile.data().data();
  size_t pos = 0;

  // Step 3: Local headers followed by entry data
  std::vector<FileEntry> written;
  written.reserve(pendingFiles_.size());

  for (const auto &pending : pendingFiles_) {
    FileEntry entry = pending.entry;
    entry.localHeaderOffset = static_cast<uint32_t>(pos);

    uint8_t *header = out + pos;
    store32(header, zip::localHeaderSignature);
    store16(header + 4, zip::versionNeeded);
    store16(header + 6, entry.flags);
    store16(header + 8, entry.method);
    store16(header + 10, entry.modTime);
    store16(header + 12, entry.modDate);
    store32(header + 14, entry.crc32);
    store32(header + 18, entry.compressedSize);
    store32(header + 22, entry.size);
    store16(header + 26, static_cast<uint16_t>(entry.path.size()));
    store16(header + 28, 0); // Extra field length
    pos += zip::localHeaderSize;

    std::memcpy(out + pos, entry.path.data(), entry.path.size());
    pos += entry.path.size();

    if (!pending.payload.empty()) {
      std::memcpy(out + pos, pending.payload.data(), pending.payload.size());
      pos += pending.payload.size();
    }

    written.push_back(std::move(entry));
  }

  // Step 4: Central directory
  size_t directoryOffset = pos;
  for (const auto &entry : written) {
    uint8_t *header = out + pos;
    store32(header, zip::centralHeaderSignature);
    store16(header + 4, zip::versionMadeBy);
    store16(header + 6, zip::versionNeeded);
    store16(header + 8, entry.flags);
    store16(header + 10, entry.method);
    store16(header + 12, entry.modTime);
    store16(header + 14, entry.modDate);
    store32(header + 16, entry.crc32);
    store32(header + 20, entry.compressedSize);
    store32(header + 24, entry.size);
    store16(header + 28, static_cast<uint16_t>(entry.path.size()));
    store16(header + 30, 0); // Extra field length
    store16(header + 32, 0); // Comment length
    store16(header + 34, 0); // Disk number start
    store16(header + 36, 0); // Internal attributes
    store32(header + 38, entry.externalAttributes);
    store32(header + 42, entry.localHeaderOffset);
    pos += zip::centralHeaderSize;

    std::memcpy(out + pos, entry.path.data(), entry.path.size());
    pos += entry.path.size();
  }

  // Step 5: End of central directory
  uint8_t *record = out + pos;
  store32(record, zip::endOfDirectorySignature);
  store16(record + 4, 0); // This disk
  store16(record + 6, 0); // Disk with the central directory
  store16(record + 8, static_cast<uint16_t>(written.size()));
  store16(record + 10, static_cast<uint16_t>(written.size()));
  store32(record + 12, static_cast<uint32_t>(pos - directoryOffset));
  store32(record + 16, static_cast<uint32_t>(directoryOffset));
  store16(record + 20, 0); // Comment length

  // Step 6: Flush to disk
  if (!outputFile.sync(outError)) {
    return false;
  }
  outputFile.close();

  entries_ = std::move(written);
  return true;
}

void Writer::clear() {
  pendingFiles_.clear();
  entries_.clear();
}

void Writer::toDosDateTime(std::time_t when, uint16_t &dosTime, uint16_t &dosDate) {
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &when);
#else
  localtime_r(&when, &local);
#endif

  // MS-DOS dates start in 1980
  int year = std::clamp(local.tm_year + 1900, 1980, 2107);
  dosDate = static_cast<uint16_t>(((year - 1980) << 9) | ((local.tm_mon + 1) << 5) |
                                  local.tm_mday);
  dosTime = static_cast<uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) |
                                  (local.tm_sec / 2));
}

} // namespace pk3
