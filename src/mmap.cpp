#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <fmt/std.h>

#include <pk3/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace pk3 {

namespace {

std::string lastSystemError() {
#ifdef _WIN32
  return std::system_category().message(static_cast<int>(GetLastError()));
#else
  return std::system_category().message(errno);
#endif
}

} // namespace

MappedFile::~MappedFile() {
  release();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : path_(std::move(other.path_)),
#ifdef _WIN32
      fileHandle_(std::exchange(other.fileHandle_, nullptr)),
      mappingHandle_(std::exchange(other.mappingHandle_, nullptr)),
#else
      fd_(std::exchange(other.fd_, -1)),
#endif
      data_(std::exchange(other.data_, nullptr)), size_(std::exchange(other.size_, 0)),
      writable_(std::exchange(other.writable_, false)) {
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
#ifdef _WIN32
    fileHandle_ = std::exchange(other.fileHandle_, nullptr);
    mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    writable_ = std::exchange(other.writable_, false);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, std::string *outError) {
  release();
  path_ = path;

#ifdef _WIN32
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    if (outError) {
      *outError = fmt::format("Failed to open {} for reading: {}", path, lastSystemError());
    }
    return false;
  }
  fileHandle_ = file;

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(file, &fileSize)) {
    if (outError) {
      *outError = fmt::format("Failed to get size of {}: {}", path, lastSystemError());
    }
    release();
    return false;
  }

  if (fileSize.QuadPart == 0) {
    if (outError) {
      *outError = fmt::format("File is empty: {}", path);
    }
    release();
    return false;
  }

  size_ = static_cast<size_t>(fileSize.QuadPart);
  if (!mapHandle(false, outError)) {
    return false;
  }
#else
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    if (outError) {
      *outError = fmt::format("Failed to open {} for reading: {}", path, lastSystemError());
    }
    return false;
  }

  struct stat st;
  if (::fstat(fd_, &st) < 0) {
    if (outError) {
      *outError = fmt::format("Failed to stat {}: {}", path, lastSystemError());
    }
    release();
    return false;
  }

  if (st.st_size == 0) {
    if (outError) {
      *outError = fmt::format("File is empty: {}", path);
    }
    release();
    return false;
  }

  size_ = static_cast<size_t>(st.st_size);
  if (!mapDescriptor(PROT_READ, MAP_PRIVATE, outError)) {
    return false;
  }

  // Archives are walked front to back once
  (void)::madvise(data_, size_, MADV_SEQUENTIAL);
#endif

  writable_ = false;
  return true;
}

bool MappedFile::create(const std::filesystem::path &path, size_t size, std::string *outError) {
  release();
  path_ = path;

  if (size == 0) {
    if (outError) {
      *outError = fmt::format("Cannot map zero bytes for {}", path);
    }
    return false;
  }

#ifdef _WIN32
  HANDLE file = CreateFileW(path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    if (outError) {
      *outError = fmt::format("Failed to create {}: {}", path, lastSystemError());
    }
    return false;
  }
  fileHandle_ = file;

  LARGE_INTEGER fileSize;
  fileSize.QuadPart = static_cast<LONGLONG>(size);
  if (!SetFilePointerEx(file, fileSize, nullptr, FILE_BEGIN) || !SetEndOfFile(file)) {
    if (outError) {
      *outError = fmt::format("Failed to size {} to {} bytes: {}", path, size, lastSystemError());
    }
    release();
    return false;
  }

  size_ = size;
  if (!mapHandle(true, outError)) {
    return false;
  }
#else
  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    if (outError) {
      *outError = fmt::format("Failed to create {}: {}", path, lastSystemError());
    }
    return false;
  }

  if (::ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    if (outError) {
      *outError = fmt::format("Failed to size {} to {} bytes: {}", path, size, lastSystemError());
    }
    release();
    return false;
  }

  size_ = size;
  if (!mapDescriptor(PROT_READ | PROT_WRITE, MAP_SHARED, outError)) {
    return false;
  }
#endif

  writable_ = true;
  return true;
}

#ifdef _WIN32
bool MappedFile::mapHandle(bool writable, std::string *outError) {
  mappingHandle_ = CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr,
                                      writable ? PAGE_READWRITE : PAGE_READONLY, 0, 0, nullptr);
  if (!mappingHandle_) {
    if (outError) {
      *outError = fmt::format("Failed to create file mapping for {}: {}", path_,
                              lastSystemError());
    }
    release();
    return false;
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_),
                        writable ? FILE_MAP_WRITE : FILE_MAP_READ, 0, 0, 0);
  if (!data_) {
    if (outError) {
      *outError = fmt::format("Failed to map {}: {}", path_, lastSystemError());
    }
    release();
    return false;
  }
  return true;
}
#else
bool MappedFile::mapDescriptor(int protection, int flags, std::string *outError) {
  void *mapped = ::mmap(nullptr, size_, protection, flags, fd_, 0);
  if (mapped == MAP_FAILED) {
    if (outError) {
      *outError = fmt::format("Failed to map {}: {}", path_, lastSystemError());
    }
    release();
    return false;
  }
  data_ = mapped;
  return true;
}
#endif

bool MappedFile::sync(std::string *outError) {
  if (!data_ || !writable_) {
    if (outError) {
      *outError = "Cannot sync: file not mapped for writing";
    }
    return false;
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0)) {
    if (outError) {
      *outError = fmt::format("Failed to flush view of {}: {}", path_, lastSystemError());
    }
    return false;
  }

  if (!FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    if (outError) {
      *outError = fmt::format("Failed to flush file buffers of {}: {}", path_, lastSystemError());
    }
    return false;
  }
#else
  if (::msync(data_, size_, MS_SYNC) < 0) {
    if (outError) {
      *outError = fmt::format("Failed to sync {}: {}", path_, lastSystemError());
    }
    return false;
  }

  if (::fsync(fd_) < 0) {
    if (outError) {
      *outError = fmt::format("Failed to fsync {}: {}", path_, lastSystemError());
    }
    return false;
  }
#endif

  return true;
}

void MappedFile::close() {
  release();
}

void MappedFile::release() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    ::munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  writable_ = false;
}

} // namespace pk3
