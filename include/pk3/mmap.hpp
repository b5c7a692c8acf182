#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace pk3 {

// RAII wrapper for a memory-mapped file (POSIX mmap or Win32 file mapping)
// A mapping is either read-only over an existing file or read-write over a
// freshly created file of fixed size.
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map an existing, non-empty file read-only
  bool openRead(const std::filesystem::path &path, std::string *outError = nullptr);

  // Create (or truncate) a file of exactly `size` bytes and map it read-write
  bool create(const std::filesystem::path &path, size_t size, std::string *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  // Write dirty pages back and flush the file to disk (read-write mappings only)
  bool sync(std::string *outError = nullptr);

  void close();

  bool isOpen() const { return data_ != nullptr; }
  bool isWritable() const { return writable_; }
  size_t size() const { return size_; }
  const std::filesystem::path &path() const { return path_; }

private:
#ifdef _WIN32
  bool mapHandle(bool writable, std::string *outError);
#else
  bool mapDescriptor(int protection, int flags, std::string *outError);
#endif
  void release() noexcept;

  std::filesystem::path path_;
#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE
  void *mappingHandle_ = nullptr; // HANDLE
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

} // namespace pk3
