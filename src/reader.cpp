#include <cstring>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/std.h>

#include <pk3/deflate.hpp>
#include <pk3/endian.hpp>
#include <pk3/reader.hpp>

namespace pk3 {

namespace {

constexpr size_t npos = static_cast<size_t>(-1);

void report(std::string *outError, ErrorKind *outKind, ErrorKind kind, std::string message) {
  if (outError) {
    *outError = std::move(message);
  }
  if (outKind) {
    *outKind = kind;
  }
}

} // namespace

std::optional<Reader> Reader::open(const std::filesystem::path &path, std::string *outError,
                                   ErrorKind *outKind) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    report(outError, outKind, ErrorKind::NotFound, fmt::format("File not found: {}", path));
    return std::nullopt;
  }
  if (ec) {
    report(outError, outKind, ErrorKind::IO,
           fmt::format("Failed to stat {}: {}", path, ec.message()));
    return std::nullopt;
  }
  if (!std::filesystem::is_regular_file(status)) {
    report(outError, outKind, ErrorKind::IO, fmt::format("Not a regular file: {}", path));
    return std::nullopt;
  }

  auto fileSize = std::filesystem::file_size(path, ec);
  if (ec) {
    report(outError, outKind, ErrorKind::IO,
           fmt::format("Failed to get file size: {} ({})", path, ec.message()));
    return std::nullopt;
  }
  if (fileSize < zip::endOfDirectorySize) {
    report(outError, outKind, ErrorKind::Format,
           fmt::format("File too small to be a ZIP archive: {} (size: {})", path, fileSize));
    return std::nullopt;
  }

  Reader reader;
  std::string error;
  if (!reader.mappedFile_.openRead(path, &error)) {
    report(outError, outKind, ErrorKind::IO, std::move(error));
    return std::nullopt;
  }

  if (!reader.parse(&error)) {
    reader.close();
    report(outError, outKind, ErrorKind::Format,
           fmt::format("{} is not a valid ZIP archive: {}", path, error));
    return std::nullopt;
  }

  return reader;
}

size_t Reader::findEndOfDirectory(std::span<const uint8_t> data) {
  if (data.size() < zip::endOfDirectorySize) {
    return npos;
  }

  // The record is followed only by the archive comment, at most 64 KiB
  size_t pos = data.size() - zip::endOfDirectorySize;
  size_t lowest = pos > zip::maxCommentSize ? pos - zip::maxCommentSize : 0;

  for (;;) {
    const uint8_t *record = data.data() + pos;
    if (load32(record) == zip::endOfDirectorySignature) {
      size_t commentLength = load16(record + 20);
      if (pos + zip::endOfDirectorySize + commentLength <= data.size()) {
        return pos;
      }
    }
    if (pos == lowest) {
      break;
    }
    --pos;
  }
  return npos;
}

bool Reader::parse(std::string *outError) {
  auto fileData = mappedFile_.data();

  size_t eocd = findEndOfDirectory(fileData);
  if (eocd == npos) {
    if (outError) {
      *outError = "end of central directory record not found";
    }
    return false;
  }

  const uint8_t *record = fileData.data() + eocd;
  uint16_t diskNumber = load16(record + 4);
  uint16_t directoryDisk = load16(record + 6);
  uint16_t entriesOnDisk = load16(record + 8);
  uint16_t totalEntries = load16(record + 10);
  uint32_t directorySize = load32(record + 12);
  uint32_t directoryOffset = load32(record + 16);

  if (eocd >= zip::zip64LocatorSize &&
      load32(fileData.data() + eocd - zip::zip64LocatorSize) == zip::zip64LocatorSignature) {
    if (outError) {
      *outError = "ZIP64 archives are not supported";
    }
    return false;
  }

  if (diskNumber != 0 || directoryDisk != 0 || entriesOnDisk != totalEntries) {
    if (outError) {
      *outError = "multi-disk archives are not supported";
    }
    return false;
  }

  if (static_cast<uint64_t>(directoryOffset) + directorySize > eocd) {
    if (outError) {
      *outError = fmt::format("central directory (offset={}, size={}) overlaps end record at {}",
                              directoryOffset, directorySize, eocd);
    }
    return false;
  }

  size_t pos = directoryOffset;
  size_t directoryEnd = static_cast<size_t>(directoryOffset) + directorySize;
  files_.reserve(totalEntries);

  for (uint32_t i = 0; i < totalEntries; ++i) {
    if (pos + zip::centralHeaderSize > directoryEnd) {
      if (outError) {
        *outError = fmt::format("central directory record {} extends beyond the directory", i);
      }
      return false;
    }

    const uint8_t *header = fileData.data() + pos;
    if (load32(header) != zip::centralHeaderSignature) {
      if (outError) {
        *outError = fmt::format("bad signature on central directory record {}", i);
      }
      return false;
    }

    FileEntry entry;
    entry.flags = load16(header + 8);
    entry.method = load16(header + 10);
    entry.modTime = load16(header + 12);
    entry.modDate = load16(header + 14);
    entry.crc32 = load32(header + 16);
    entry.compressedSize = load32(header + 20);
    entry.size = load32(header + 24);
    uint16_t nameLength = load16(header + 28);
    uint16_t extraLength = load16(header + 30);
    uint16_t commentLength = load16(header + 32);
    entry.externalAttributes = load32(header + 38);
    entry.localHeaderOffset = load32(header + 42);

    size_t recordSize = zip::centralHeaderSize + nameLength + extraLength + commentLength;
    if (pos + recordSize > directoryEnd) {
      if (outError) {
        *outError = fmt::format("name or extra field of record {} extends beyond the directory", i);
      }
      return false;
    }

    entry.path.assign(reinterpret_cast<const char *>(header + zip::centralHeaderSize),
                      nameLength);
    pos += recordSize;

    files_.push_back(std::move(entry));
  }

  lookup_.reserve(files_.size());
  for (size_t i = 0; i < files_.size(); ++i) {
    lookup_.emplace(files_[i].path, i);
  }

  return true;
}

const FileEntry *Reader::findFile(const std::string &path) const {
  auto it = lookup_.find(path);
  if (it == lookup_.end()) {
    return nullptr;
  }
  return &files_[it->second];
}

std::span<const uint8_t> Reader::getRawView(const FileEntry &entry, std::string *outError) const {
  auto archiveData = mappedFile_.data();

  size_t offset = entry.localHeaderOffset;
  if (offset + zip::localHeaderSize > archiveData.size()) {
    if (outError) {
      *outError = fmt::format("Local header of {} lies outside the archive", entry.path);
    }
    return {};
  }

  const uint8_t *header = archiveData.data() + offset;
  if (load32(header) != zip::localHeaderSignature) {
    if (outError) {
      *outError = fmt::format("Bad local header signature for {}", entry.path);
    }
    return {};
  }

  // The local extra field may differ in length from the central one
  size_t dataOffset = offset + zip::localHeaderSize + load16(header + 26) + load16(header + 28);
  if (dataOffset + entry.compressedSize > archiveData.size()) {
    if (outError) {
      *outError =
          fmt::format("Data of {} extends beyond the archive (offset={}, size={}, fileSize={})",
                      entry.path, dataOffset, entry.compressedSize, archiveData.size());
    }
    return {};
  }

  return archiveData.subspan(dataOffset, entry.compressedSize);
}

std::optional<std::vector<uint8_t>> Reader::extractToMemory(const FileEntry &entry,
                                                            std::string *outError) const {
  if (entry.isEncrypted()) {
    if (outError) {
      *outError = fmt::format("{} is encrypted", entry.path);
    }
    return std::nullopt;
  }

  std::string error;
  auto raw = getRawView(entry, &error);
  if (raw.data() == nullptr) {
    if (outError) {
      *outError = std::move(error);
    }
    return std::nullopt;
  }

  std::optional<std::vector<uint8_t>> result;
  switch (entry.method) {
  case zip::methodStored:
    if (entry.compressedSize != entry.size) {
      if (outError) {
        *outError = fmt::format("Stored entry {} has mismatched sizes ({} vs {})", entry.path,
                                entry.compressedSize, entry.size);
      }
      return std::nullopt;
    }
    result.emplace(raw.begin(), raw.end());
    break;
  case zip::methodDeflate:
    result = inflateRaw(raw, entry.size, &error);
    if (!result) {
      if (outError) {
        *outError = fmt::format("Failed to inflate {}: {}", entry.path, error);
      }
      return std::nullopt;
    }
    break;
  default:
    if (outError) {
      *outError = fmt::format("Unsupported compression method {} for {}", entry.method,
                              entry.path);
    }
    return std::nullopt;
  }

  uint32_t actual = crc32(*result);
  if (actual != entry.crc32) {
    if (outError) {
      *outError = fmt::format("CRC mismatch for {} (expected {:08x}, got {:08x})", entry.path,
                              entry.crc32, actual);
    }
    return std::nullopt;
  }

  return result;
}

void Reader::close() {
  mappedFile_.close();
  files_.clear();
  lookup_.clear();
}

} // namespace pk3
