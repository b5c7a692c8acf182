#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "mmap.hpp"
#include "types.hpp"

namespace pk3 {

// Read-only view of a ZIP archive. The whole file is memory-mapped and the
// central directory is parsed up front; entry data is decoded on demand.
class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Open a ZIP archive from file
  // Returns std::nullopt on failure. outError receives a message and outKind
  // tells a missing file (NotFound) from an unreadable one (IO) from bytes
  // that are not a ZIP archive (Format).
  static std::optional<Reader> open(const std::filesystem::path &path,
                                    std::string *outError = nullptr,
                                    ErrorKind *outKind = nullptr);

  // Entries in central directory order
  const std::vector<FileEntry> &files() const { return files_; }

  size_t fileCount() const { return files_.size(); }

  // Exact (case-sensitive) name lookup; the first entry wins for duplicate names
  // Returns nullptr if no entry has this name
  const FileEntry *findFile(const std::string &path) const;

  // Stored bytes of an entry, still compressed
  // Returns an empty span if the local header is damaged or out of bounds
  std::span<const uint8_t> getRawView(const FileEntry &entry,
                                      std::string *outError = nullptr) const;

  // Decompress an entry and verify its size and CRC-32
  std::optional<std::vector<uint8_t>> extractToMemory(const FileEntry &entry,
                                                      std::string *outError = nullptr) const;

  bool isOpen() const { return mappedFile_.isOpen(); }

  const std::filesystem::path &path() const { return mappedFile_.path(); }

  void close();

private:
  bool parse(std::string *outError);

  // Offset of the end of central directory record, or npos
  static size_t findEndOfDirectory(std::span<const uint8_t> data);

  MappedFile mappedFile_;
  std::vector<FileEntry> files_;
  std::unordered_map<std::string, size_t> lookup_; // name -> index of first occurrence
};

} // namespace pk3
