#pragma once

#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include "rpc/call.hpp"
#include "transfer/transfer_options.hpp"

namespace rcopy {
namespace client {

struct ClientOptions {
  std::string host = "localhost";
  uint16_t port = 8022;
  bool tls = false;
  std::size_t buffer_size = transfer::DEFAULT_BUFFER_SIZE;
};

// A copy argument split into host and path. host is empty for a local path.
struct CopyTarget {
  std::string host;
  std::string path;

  bool is_remote() const { return !host.empty(); }
};

// "host:path" is remote. A colon after the first '/' belongs to a local path.
CopyTarget parse_copy_target(const std::string& argument);

class FileTransferClient {
public:
  explicit FileTransferClient(ClientOptions options);

  FileTransferClient(const FileTransferClient&) = delete;
  FileTransferClient& operator=(const FileTransferClient&) = delete;


  // ---- TRANSFERS ----
  // Sends local_path to the server as remote_path. Returns the bytes sent.
  // Throws transfer errors for the local file and rpc::RpcError for a failed call.
  int64_t upload(const std::string& local_path, const std::string& remote_path);
  // Fetches remote_path into local_path. Returns the bytes received.
  // Throws transfer::SizeMismatchError if the stream ends short of the announced size.
  int64_t download(const std::string& remote_path, const std::string& local_path);
  // Uploads or downloads depending on which side is remote.
  // Throws std::invalid_argument unless exactly one side is remote.
  int64_t copy(const std::string& source, const std::string& destination);


  // ---- CONTROL ----
  std::string ping(const std::string& message = "ping");
  void shutdown();


  const ClientOptions& options() const { return options_; }

private:
  ClientOptions options_;
  boost::asio::io_context io_context_;

  std::unique_ptr<rpc::ClientCall> open_call(rpc::Method method, const std::string& host);
  int64_t upload_to(const std::string& host, const std::string& local_path, const std::string& remote_path);
  int64_t download_from(const std::string& host, const std::string& remote_path, const std::string& local_path);
};

} // namespace client
} // namespace rcopy
