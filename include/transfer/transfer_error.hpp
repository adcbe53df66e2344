#ifndef RCOPY_TRANSFER_ERROR_HPP
#define RCOPY_TRANSFER_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rcopy {
namespace transfer {

// File I/O or integrity failure that ends a single transfer session
class TransferIoError : public std::runtime_error {
public:
    explicit TransferIoError(const std::string& message)
        : std::runtime_error(message) {}
};

class FileOpenError : public TransferIoError {
public:
    explicit FileOpenError(const std::string& message)
        : TransferIoError("failed to open file: " + message) {}
};

class ReadError : public TransferIoError {
public:
    explicit ReadError(const std::string& message)
        : TransferIoError("failed to read file: " + message) {}
};

class WriteError : public TransferIoError {
public:
    explicit WriteError(const std::string& message)
        : TransferIoError("failed to write file: " + message) {}
};

// A peer sent more content in one chunk than the transfer buffer allows
class ChunkTooLargeError : public TransferIoError {
public:
    ChunkTooLargeError(std::size_t chunk_size, std::size_t limit)
        : TransferIoError("chunk of " + std::to_string(chunk_size) +
                          " bytes exceeds buffer size of " + std::to_string(limit) + " bytes") {}
};

// Bytes transferred differ from the declared or stat size
class SizeMismatchError : public TransferIoError {
public:
    SizeMismatchError(int64_t expected, int64_t actual)
        : TransferIoError("file size mismatch: expected " + std::to_string(expected) +
                          " bytes, got " + std::to_string(actual) + " bytes")
        , expected_(expected)
        , actual_(actual) {}

    int64_t expected() const { return expected_; }
    int64_t actual() const { return actual_; }

private:
    int64_t expected_;
    int64_t actual_;
};

} // namespace transfer
} // namespace rcopy

#endif // RCOPY_TRANSFER_ERROR_HPP
