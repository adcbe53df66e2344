#ifndef RCOPY_TRANSFER_FILE_HANDLE_HPP
#define RCOPY_TRANSFER_FILE_HANDLE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include "transfer/transfer_error.hpp"

namespace rcopy {
namespace transfer {

/**
 * Owns one POSIX file descriptor for the lifetime of a transfer.
 * The descriptor is closed on destruction, whichever way the transfer ends.
 */
class FileHandle {
public:
  FileHandle() = default;
  ~FileHandle();

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;
  FileHandle(FileHandle&& other) noexcept;
  FileHandle& operator=(FileHandle&& other) noexcept;


  // ---- OPENING ----
  // Write-only, created with mode 0644 if absent, not truncated. Throws FileOpenError.
  static FileHandle open_for_write(const std::string& path);
  // Read-only regular file. Throws FileOpenError.
  static FileHandle open_for_read(const std::string& path);


  // ---- I/O ----
  // Returns the number of bytes written, which may be short. Throws WriteError on failure.
  std::size_t write(const void* data, std::size_t size);
  // Returns 0 at end of file. Throws ReadError on failure.
  std::size_t read(void* data, std::size_t size);
  // Current size from fstat
  int64_t size() const;
  // Cuts the file to exactly size bytes
  void truncate(int64_t size);
  // Closes explicitly so close errors can be reported. Throws WriteError.
  void close();


  // ---- GETTERS ----
  bool is_open() const { return fd_ >= 0; }
  const std::string& path() const { return path_; }

private:
  FileHandle(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

  int fd_ = -1;
  std::string path_;
};

} // namespace transfer
} // namespace rcopy

#endif // RCOPY_TRANSFER_FILE_HANDLE_HPP
