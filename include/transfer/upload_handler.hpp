#ifndef RCOPY_TRANSFER_UPLOAD_HANDLER_HPP
#define RCOPY_TRANSFER_UPLOAD_HANDLER_HPP

#include <cstdint>
#include <string>
#include "rpc/call.hpp"
#include "rpc/messages.hpp"
#include "transfer/file_handle.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_options.hpp"
#include "transfer/upload_state.hpp"

namespace rcopy {
namespace transfer {

constexpr const char* UPLOAD_SUCCESS_MESSAGE = "Upload received successfully";

/**
 * Consumes one inbound chunk stream into a destination file.
 *
 * The first chunk names the destination and declares the total size. The
 * destination is opened exactly once, written from offset 0 and cut to the
 * received length when the stream ends with a matching count. On any failure
 * the file is left as-is and the session moves to FAILED.
 */
class UploadSession {
public:
  explicit UploadSession(const TransferOptions& options = TransferOptions())
    : options_(options) {}

  // Writes one chunk, opening the destination on the first one. Throws
  // ChunkTooLargeError for content above the buffer size, FileOpenError,
  // WriteError, or std::logic_error after the session finished.
  void on_chunk(const rpc::FileUploadRequest& chunk);

  // Verifies the byte count and finalizes the file. Throws SizeMismatchError.
  rpc::FileUploadResponse on_end_of_stream();

  // Marks the session failed after a transport error
  void fail(const std::string& reason);

  UploadState::State state() const { return state_.get_state(); }
  int64_t bytes_written() const { return bytes_written_; }
  int64_t declared_size() const { return declared_size_; }
  const std::string& filename() const { return filename_; }

private:
  void open_destination(const rpc::FileUploadRequest& first);
  void write_content(const std::string& content);
  void transition(UploadState::State next);

  TransferOptions options_;
  UploadState state_;
  FileHandle file_;
  std::string filename_;
  int64_t declared_size_ = 0;
  int64_t bytes_written_ = 0;
};

// Drives an UploadSession from a client stream until the client half-closes
rpc::FileUploadResponse handle_upload(rpc::ServerReader<rpc::FileUploadRequest>& reader,
                                      const TransferOptions& options = TransferOptions());

} // namespace transfer
} // namespace rcopy

#endif // RCOPY_TRANSFER_UPLOAD_HANDLER_HPP
