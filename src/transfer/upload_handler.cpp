#include "transfer/upload_handler.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace rcopy {
namespace transfer {

//==============================================
// SESSION
//==============================================

void UploadSession::on_chunk(const rpc::FileUploadRequest& chunk) {
  if (state_.is_terminal()) {
    throw std::logic_error("upload session already " + state_.get_state_string());
  }

  try {
    if (chunk.content.size() > options_.buffer_size) {
      throw ChunkTooLargeError(chunk.content.size(), options_.buffer_size);
    }
    if (state_.get_state() == UploadState::State::AWAITING_FIRST_CHUNK) {
      open_destination(chunk);
    }
    write_content(chunk.content);
  } catch (const TransferIoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload: " << e.what();
    transition(UploadState::State::FAILED);
    throw;
  }
}

rpc::FileUploadResponse UploadSession::on_end_of_stream() {
  if (state_.is_terminal()) {
    throw std::logic_error("upload session already " + state_.get_state_string());
  }

  try {
    if (bytes_written_ != declared_size_) {
      throw SizeMismatchError(declared_size_, bytes_written_);
    }
    if (file_.is_open()) {
      file_.truncate(bytes_written_);
      file_.close();
    }
  } catch (const TransferIoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload: " << e.what();
    transition(UploadState::State::FAILED);
    throw;
  }

  transition(UploadState::State::COMPLETED);
  BOOST_LOG_TRIVIAL(info) << "Upload: Received " << bytes_written_ << " bytes into "
                          << (filename_.empty() ? "<none>" : filename_);

  rpc::FileUploadResponse response;
  response.message = UPLOAD_SUCCESS_MESSAGE;
  return response;
}

void UploadSession::fail(const std::string& reason) {
  BOOST_LOG_TRIVIAL(error) << "Upload: Failed to receive file: " << reason;
  if (!state_.is_terminal()) {
    transition(UploadState::State::FAILED);
  }
}

void UploadSession::open_destination(const rpc::FileUploadRequest& first) {
  file_ = FileHandle::open_for_write(first.filename);
  filename_ = first.filename;
  declared_size_ = first.size;
  transition(UploadState::State::RECEIVING);
  BOOST_LOG_TRIVIAL(debug) << "Upload: Receiving " << filename_ << ", declared " << declared_size_ << " bytes";
}

void UploadSession::write_content(const std::string& content) {
  if (content.empty()) {
    return;
  }
  std::size_t written = file_.write(content.data(), content.size());
  if (written != content.size()) {
    throw WriteError("short write to " + filename_ + ": " + std::to_string(written) +
                     " of " + std::to_string(content.size()) + " bytes");
  }
  bytes_written_ += static_cast<int64_t>(written);
}

void UploadSession::transition(UploadState::State next) {
  UploadState::State previous = state_.get_state();
  if (!state_.transition_to(next)) {
    throw std::logic_error("invalid upload transition " + UploadState::state_to_string(previous) +
                           " -> " + UploadState::state_to_string(next));
  }
  BOOST_LOG_TRIVIAL(trace) << "Upload: " << previous << " -> " << next;
}

//==============================================
// HANDLER
//==============================================

rpc::FileUploadResponse handle_upload(rpc::ServerReader<rpc::FileUploadRequest>& reader,
                                      const TransferOptions& options) {
  UploadSession session(options);
  rpc::FileUploadRequest chunk;

  try {
    while (reader.read(chunk)) {
      session.on_chunk(chunk);
    }
  } catch (const network::TransferError& e) {
    session.fail(e.what());
    throw;
  }

  return session.on_end_of_stream();
}

} // namespace transfer
} // namespace rcopy
