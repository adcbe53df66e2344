#include "client/file_transfer_client.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include "network/connector.hpp"
#include "transfer/file_handle.hpp"
#include "transfer/transfer_error.hpp"

namespace rcopy {
namespace client {

CopyTarget parse_copy_target(const std::string& argument) {
  CopyTarget target;
  std::size_t colon = argument.find(':');
  std::size_t slash = argument.find('/');
  if (colon == std::string::npos || colon == 0 || (slash != std::string::npos && slash < colon)) {
    target.path = argument;
    return target;
  }
  target.host = argument.substr(0, colon);
  target.path = argument.substr(colon + 1);
  return target;
}

FileTransferClient::FileTransferClient(ClientOptions options)
  : options_(std::move(options)) {
  if (options_.buffer_size == 0) {
    options_.buffer_size = transfer::DEFAULT_BUFFER_SIZE;
  }
  // A chunk plus its field headers must fit in one frame
  if (options_.buffer_size > rpc::MAX_FRAME_PAYLOAD - 64) {
    throw std::invalid_argument("buffer size " + std::to_string(options_.buffer_size) + " exceeds frame limit");
  }
}

//==============================================
// TRANSFERS
//==============================================

int64_t FileTransferClient::upload(const std::string& local_path, const std::string& remote_path) {
  return upload_to(options_.host, local_path, remote_path);
}

int64_t FileTransferClient::download(const std::string& remote_path, const std::string& local_path) {
  return download_from(options_.host, remote_path, local_path);
}

int64_t FileTransferClient::copy(const std::string& source, const std::string& destination) {
  CopyTarget from = parse_copy_target(source);
  CopyTarget to = parse_copy_target(destination);

  if (from.is_remote() == to.is_remote()) {
    throw std::invalid_argument("exactly one of source and destination must be host:path");
  }
  if (from.path.empty() || to.path.empty()) {
    throw std::invalid_argument("source and destination paths must not be empty");
  }

  if (from.is_remote()) {
    return download_from(from.host, from.path, to.path);
  }
  return upload_to(to.host, from.path, to.path);
}

int64_t FileTransferClient::upload_to(const std::string& host, const std::string& local_path,
                                      const std::string& remote_path) {
  transfer::FileHandle file = transfer::FileHandle::open_for_read(local_path);
  const int64_t size = file.size();
  BOOST_LOG_TRIVIAL(info) << "Client: Uploading " << local_path << " (" << size << " bytes) to "
                          << host << ":" << remote_path;

  auto call = open_call(rpc::Method::UPLOAD, host);

  std::string buffer(options_.buffer_size, '\0');
  rpc::FileUploadRequest chunk;
  chunk.filename = remote_path;
  chunk.size = size;

  int64_t sent = 0;
  bool first = true;
  try {
    while (true) {
      std::size_t got = file.read(&buffer[0], buffer.size());
      // An empty file still sends one chunk so the server creates it
      if (got == 0 && !first) {
        break;
      }
      chunk.content.assign(buffer.data(), got);
      call->send(chunk);
      sent += static_cast<int64_t>(got);
      if (first) {
        chunk.filename.clear();
        chunk.size = 0;
        first = false;
      }
      if (got == 0) {
        break;
      }
    }
    call->half_close();
  } catch (const rpc::ProtocolError&) {
    throw;
  } catch (const network::TransferError& e) {
    // The server may have ended the call early, in which case its status says why
    BOOST_LOG_TRIVIAL(debug) << "Client: Upload send failed after " << sent << " bytes: " << e.what();
    call->finish();
    throw;
  }

  rpc::FileUploadResponse response;
  if (!call->receive(response)) {
    call->finish();
    throw rpc::ProtocolError("upload ended without a response");
  }
  call->finish();

  BOOST_LOG_TRIVIAL(info) << "Client: " << response.message << " (" << sent << " bytes)";
  return sent;
}

int64_t FileTransferClient::download_from(const std::string& host, const std::string& remote_path,
                                          const std::string& local_path) {
  BOOST_LOG_TRIVIAL(info) << "Client: Downloading " << host << ":" << remote_path << " to " << local_path;

  auto call = open_call(rpc::Method::DOWNLOAD, host);
  rpc::FileDownloadRequest request;
  request.filename = remote_path;
  call->send(request);

  // Opened on the first chunk so a failed call leaves no local file behind
  transfer::FileHandle file;
  int64_t received = 0;
  int64_t expected = 0;

  rpc::FileDownloadResponse chunk;
  while (call->receive(chunk)) {
    if (!file.is_open()) {
      file = transfer::FileHandle::open_for_write(local_path);
      expected = chunk.size;
    } else if (chunk.size != expected) {
      BOOST_LOG_TRIVIAL(error) << "Client: Download of " << remote_path << " announced " << expected
                               << " bytes, then " << chunk.size;
      throw rpc::ProtocolError("download size changed from " + std::to_string(expected) +
                               " to " + std::to_string(chunk.size) + " bytes");
    }
    if (chunk.content.empty()) {
      continue;
    }
    std::size_t written = file.write(chunk.content.data(), chunk.content.size());
    if (written != chunk.content.size()) {
      throw transfer::WriteError("short write to " + local_path + ": " + std::to_string(written) +
                                 " of " + std::to_string(chunk.content.size()) + " bytes");
    }
    received += static_cast<int64_t>(written);
  }
  call->finish();
  if (!file.is_open()) {
    file = transfer::FileHandle::open_for_write(local_path);
  }

  if (received != expected) {
    BOOST_LOG_TRIVIAL(error) << "Client: Download of " << remote_path << " ended after " << received
                             << " of " << expected << " bytes";
    throw transfer::SizeMismatchError(expected, received);
  }
  // Drop stale bytes of a longer pre-existing local file
  file.truncate(received);
  file.close();

  BOOST_LOG_TRIVIAL(info) << "Client: Downloaded " << received << " bytes";
  return received;
}

//==============================================
// CONTROL
//==============================================

std::string FileTransferClient::ping(const std::string& message) {
  auto call = open_call(rpc::Method::PING, options_.host);
  rpc::PingRequest request;
  request.message = message;
  call->send(request);

  rpc::PingResponse response;
  if (!call->receive(response)) {
    call->finish();
    throw rpc::ProtocolError("ping ended without a response");
  }
  call->finish();
  BOOST_LOG_TRIVIAL(debug) << "Client: Ping answered: " << response.message;
  return response.message;
}

void FileTransferClient::shutdown() {
  auto call = open_call(rpc::Method::SHUTDOWN, options_.host);
  call->send(rpc::ShutdownRequest());

  rpc::ShutdownResponse response;
  if (!call->receive(response)) {
    call->finish();
    throw rpc::ProtocolError("shutdown ended without a response");
  }
  call->finish();
  BOOST_LOG_TRIVIAL(info) << "Client: Server at " << options_.host << ":" << options_.port << " is shutting down";
}

std::unique_ptr<rpc::ClientCall> FileTransferClient::open_call(rpc::Method method, const std::string& host) {
  auto connection = network::connect(io_context_, host, options_.port, options_.tls);
  return std::make_unique<rpc::ClientCall>(std::move(connection), method);
}

} // namespace client
} // namespace rcopy
