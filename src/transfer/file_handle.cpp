#include "transfer/file_handle.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rcopy {
namespace transfer {

namespace {

std::string describe(const std::string& path) {
  return path + ": " + std::strerror(errno);
}

} // namespace

FileHandle::~FileHandle() {
  if (fd_ >= 0) {
    if (::close(fd_) != 0) {
      BOOST_LOG_TRIVIAL(warning) << "FileHandle: Close failed for " << describe(path_);
    }
    fd_ = -1;
  }
}

FileHandle::FileHandle(FileHandle&& other) noexcept
  : fd_(other.fd_)
  , path_(std::move(other.path_)) {
  other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = other.fd_;
    path_ = std::move(other.path_);
    other.fd_ = -1;
  }
  return *this;
}

//==============================================
// OPENING
//==============================================

FileHandle FileHandle::open_for_write(const std::string& path) {
  if (path.empty()) {
    throw FileOpenError("empty filename");
  }
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw FileOpenError(describe(path));
  }
  BOOST_LOG_TRIVIAL(debug) << "FileHandle: Opened " << path << " for writing";
  return FileHandle(fd, path);
}

FileHandle FileHandle::open_for_read(const std::string& path) {
  if (path.empty()) {
    throw FileOpenError("empty filename");
  }
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    throw FileOpenError(describe(path));
  }
  FileHandle handle(fd, path);

  struct stat info;
  if (::fstat(fd, &info) != 0) {
    throw FileOpenError(describe(path));
  }
  if (S_ISDIR(info.st_mode)) {
    throw FileOpenError(path + ": is a directory");
  }
  BOOST_LOG_TRIVIAL(debug) << "FileHandle: Opened " << path << " for reading";
  return handle;
}

//==============================================
// I/O
//==============================================

std::size_t FileHandle::write(const void* data, std::size_t size) {
  ssize_t written;
  do {
    written = ::write(fd_, data, size);
  } while (written < 0 && errno == EINTR);

  if (written < 0) {
    throw WriteError(describe(path_));
  }
  return static_cast<std::size_t>(written);
}

std::size_t FileHandle::read(void* data, std::size_t size) {
  ssize_t got;
  do {
    got = ::read(fd_, data, size);
  } while (got < 0 && errno == EINTR);

  if (got < 0) {
    throw ReadError(describe(path_));
  }
  return static_cast<std::size_t>(got);
}

int64_t FileHandle::size() const {
  struct stat info;
  if (::fstat(fd_, &info) != 0) {
    throw ReadError(describe(path_));
  }
  return static_cast<int64_t>(info.st_size);
}

void FileHandle::truncate(int64_t size) {
  if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
    throw WriteError(describe(path_));
  }
}

void FileHandle::close() {
  if (fd_ < 0) {
    return;
  }
  int result = ::close(fd_);
  fd_ = -1;
  if (result != 0) {
    throw WriteError(describe(path_));
  }
}

} // namespace transfer
} // namespace rcopy
