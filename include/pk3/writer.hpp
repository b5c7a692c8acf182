#pragma once

#include <ctime>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace pk3 {

// Builds a new ZIP archive. Entries are compressed as they are added and the
// finished archive is laid out in one pass by write().
class Writer {
public:
  Writer() = default;
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Add an entry from memory, stamped with the current local time
  // The archivePath is stored exactly as given; a trailing '/' makes a directory entry
  // Returns true on success, false on failure (error in outError if provided)
  bool addFile(std::span<const uint8_t> data, const std::string &archivePath,
               std::string *outError = nullptr);

  // Add an entry carrying over the name, timestamp and attributes of `source`
  // (typically an entry read from another archive). `data` is the uncompressed content.
  // The UTF-8 name flag is taken from `source` as is; addFile() sets it for any non-ASCII name.
  bool addEntry(const FileEntry &source, std::span<const uint8_t> data,
                std::string *outError = nullptr);

  // Write archive to disk, replacing any file at destPath
  // Returns true on success, false on failure (error in outError if provided)
  bool write(const std::filesystem::path &destPath, std::string *outError = nullptr);

  // Clear all files
  void clear();

  // Entries as laid out by the last successful write()
  const std::vector<FileEntry> &files() const { return entries_; }

  // Get number of files to be written
  size_t fileCount() const { return pendingFiles_.size(); }

  // MS-DOS date and time fields for a timestamp, in local time
  static void toDosDateTime(std::time_t when, uint16_t &dosTime, uint16_t &dosDate);

private:
  bool enqueue(FileEntry entry, std::span<const uint8_t> data, std::string *outError);

  struct PendingFile {
    FileEntry entry;              // Header fields; offsets are assigned by write()
    std::vector<uint8_t> payload; // Bytes as stored (deflated or verbatim)
  };

  std::vector<PendingFile> pendingFiles_;
  std::vector<FileEntry> entries_;
};

} // namespace pk3
