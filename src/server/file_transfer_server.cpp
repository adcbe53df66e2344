#include "server/file_transfer_server.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include "rpc/call.hpp"
#include "rpc/codec.hpp"
#include "transfer/download_handler.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/upload_handler.hpp"

namespace rcopy {
namespace server {

namespace {

// Unary and server-streaming calls carry exactly one request message
template <typename Request>
Request read_request(network::Connection& connection) {
  rpc::ConnectionReader<Request> reader(connection);
  Request request;
  if (!reader.read(request)) {
    throw rpc::ProtocolError("call ended before its request message");
  }
  return request;
}

template <typename Response>
void write_response(network::Connection& connection, const Response& response) {
  rpc::ConnectionWriter<Response> writer(connection);
  writer.write(response);
}

rpc::Status make_status(rpc::StatusCode code, const std::string& message) {
  rpc::Status status;
  status.code = code;
  status.message = message;
  return status;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileTransferServer::FileTransferServer(ServerOptions options)
  : options_(std::move(options))
  , is_running_(false)
  , next_session_id_(0)
  , shutdown_(options_.shutdown_delay, options_.terminate) {
  BOOST_LOG_TRIVIAL(debug) << "Server: Initializing server for " << options_.host << ":" << options_.port;
}

FileTransferServer::~FileTransferServer() {
  stop();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

void FileTransferServer::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_running_) {
    throw std::logic_error("server already running");
  }

  network::ListenerOptions listener_options;
  listener_options.host = options_.host;
  listener_options.port = options_.port;
  listener_options.tls = options_.tls;
  listener_ = network::make_listener(io_context_, listener_options);

  is_running_ = true;
  io_context_.restart();

  BOOST_LOG_TRIVIAL(debug) << "Server: Starting to accept connections";
  listener_->start_accept([this](std::unique_ptr<network::Connection> connection) {
    on_accept(std::move(connection));
  });

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Server: IO context error: " << e.what();
    }
  });

  BOOST_LOG_TRIVIAL(info) << "Server: Accepting connections on port " << listener_->port();
}

void FileTransferServer::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  stopped_cv_.wait(lock, [this]() { return !is_running_; });
}

void FileTransferServer::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_running_) {
      return;
    }
    is_running_ = false;
  }

  BOOST_LOG_TRIVIAL(info) << "Server: Initiating server shutdown";

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  // The io thread is gone, so the acceptor can be closed from here
  listener_->close();

  std::map<uint64_t, std::thread> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.swap(sessions_);
    finished_sessions_.clear();
  }
  BOOST_LOG_TRIVIAL(debug) << "Server: Waiting for " << sessions.size() << " sessions";
  for (auto& entry : sessions) {
    if (entry.second.joinable()) {
      entry.second.join();
    }
  }

  stopped_cv_.notify_all();
  BOOST_LOG_TRIVIAL(info) << "Server: Server shutdown complete";
}

//==============================================
// GETTERS
//==============================================

uint16_t FileTransferServer::port() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listener_ ? listener_->port() : options_.port;
}

bool FileTransferServer::is_secure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listener_ && listener_->is_secure();
}

bool FileTransferServer::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return is_running_;
}

//==============================================
// SESSIONS
//==============================================

void FileTransferServer::on_accept(std::unique_ptr<network::Connection> connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!is_running_) {
    BOOST_LOG_TRIVIAL(debug) << "Server: Dropping connection accepted during shutdown";
    return;
  }

  reap_finished_sessions();

  uint64_t id = next_session_id_++;
  BOOST_LOG_TRIVIAL(debug) << "Server: Session " << id << " with " << connection->remote_endpoint();
  sessions_.emplace(id, std::thread(&FileTransferServer::run_session, this, id, std::move(connection)));
}

void FileTransferServer::run_session(uint64_t id, std::unique_ptr<network::Connection> connection) {
  const std::string peer = connection->remote_endpoint();
  bool shutdown_requested = false;

  try {
    connection->handshake();
    rpc::Frame call = rpc::Codec::read_frame(*connection);

    rpc::Status status;
    rpc::Method method = rpc::Method::PING;
    bool valid_call = false;
    if (call.type != rpc::FrameType::CALL) {
      status = make_status(rpc::StatusCode::INVALID_ARGUMENT,
                           std::string("expected CALL frame, got ") + rpc::frame_type_to_string(call.type));
    } else if (call.payload.size() == 1 &&
               static_cast<uint8_t>(call.payload[0]) > static_cast<uint8_t>(rpc::Method::SHUTDOWN)) {
      status = make_status(rpc::StatusCode::UNIMPLEMENTED,
                           "unknown method " + std::to_string(static_cast<uint8_t>(call.payload[0])));
    } else {
      try {
        rpc::Codec::deserialize(call.payload, method);
        valid_call = true;
      } catch (const rpc::ProtocolError& e) {
        status = make_status(rpc::StatusCode::INVALID_ARGUMENT, e.what());
      }
    }

    if (valid_call) {
      BOOST_LOG_TRIVIAL(debug) << "Server: Session " << id << " calls " << rpc::method_to_string(method);
      status = dispatch(method, *connection);
    } else {
      BOOST_LOG_TRIVIAL(warning) << "Server: Rejecting call from " << peer << ": " << status.message;
    }

    rpc::Codec::write_frame(*connection, rpc::FrameType::STATUS, rpc::Codec::serialize(status));
    shutdown_requested = valid_call && method == rpc::Method::SHUTDOWN && status.ok();
  } catch (const network::TransferError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Server: Session " << id << " with " << peer << " ended: " << e.what();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Server: Session " << id << " with " << peer << " failed: " << e.what();
  }

  connection->close();
  if (shutdown_requested) {
    shutdown_.schedule();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  finished_sessions_.push_back(id);
}

void FileTransferServer::reap_finished_sessions() {
  for (uint64_t id : finished_sessions_) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      continue;
    }
    if (it->second.joinable()) {
      it->second.join();
    }
    sessions_.erase(it);
  }
  finished_sessions_.clear();
}

//==============================================
// DISPATCH
//==============================================

rpc::Status FileTransferServer::dispatch(rpc::Method method, network::Connection& connection) {
  try {
    switch (method) {
      case rpc::Method::UPLOAD:
        serve_upload(connection);
        break;
      case rpc::Method::DOWNLOAD:
        serve_download(connection);
        break;
      case rpc::Method::PING:
        serve_ping(connection);
        break;
      case rpc::Method::SHUTDOWN:
        serve_shutdown(connection);
        break;
      default:
        return make_status(rpc::StatusCode::UNIMPLEMENTED, "unknown method");
    }
  } catch (const std::exception& e) {
    rpc::Status status = status_from_exception(e);
    BOOST_LOG_TRIVIAL(warning) << "Server: " << rpc::method_to_string(method) << " failed with "
                               << rpc::status_code_to_string(status.code) << ": " << status.message;
    return status;
  }
  return rpc::Status();
}

void FileTransferServer::serve_upload(network::Connection& connection) {
  rpc::ConnectionReader<rpc::FileUploadRequest> reader(connection);
  rpc::FileUploadResponse response;
  try {
    response = transfer::handle_upload(reader, options_.transfer);
  } catch (const transfer::TransferIoError&) {
    // Closing with unread client data resets the connection and loses the status
    rpc::FileUploadRequest discarded;
    while (reader.read(discarded)) {
    }
    throw;
  }
  write_response(connection, response);
}

void FileTransferServer::serve_download(network::Connection& connection) {
  auto request = read_request<rpc::FileDownloadRequest>(connection);
  rpc::ConnectionWriter<rpc::FileDownloadResponse> writer(connection);
  transfer::handle_download(request, writer, options_.transfer);
}

void FileTransferServer::serve_ping(network::Connection& connection) {
  auto request = read_request<rpc::PingRequest>(connection);
  write_response(connection, handle_ping(request));
}

void FileTransferServer::serve_shutdown(network::Connection& connection) {
  auto request = read_request<rpc::ShutdownRequest>(connection);
  write_response(connection, shutdown_.handle_shutdown(request));
}

//==============================================
// FREE FUNCTIONS
//==============================================

rpc::Status status_from_exception(const std::exception& error) {
  rpc::StatusCode code = rpc::StatusCode::UNKNOWN;
  if (dynamic_cast<const transfer::FileOpenError*>(&error)) {
    code = rpc::StatusCode::NOT_FOUND;
  } else if (dynamic_cast<const transfer::SizeMismatchError*>(&error)) {
    code = rpc::StatusCode::DATA_LOSS;
  } else if (dynamic_cast<const transfer::ChunkTooLargeError*>(&error)) {
    code = rpc::StatusCode::INVALID_ARGUMENT;
  } else if (dynamic_cast<const transfer::TransferIoError*>(&error)) {
    code = rpc::StatusCode::INTERNAL;
  } else if (dynamic_cast<const rpc::ProtocolError*>(&error)) {
    // Before TransferError, which it derives from
    code = rpc::StatusCode::INVALID_ARGUMENT;
  } else if (dynamic_cast<const network::TransferError*>(&error)) {
    code = rpc::StatusCode::UNAVAILABLE;
  }
  return make_status(code, error.what());
}

void run_server(const ServerOptions& options) {
  FileTransferServer server(options);
  server.start();
  BOOST_LOG_TRIVIAL(info) << "Server: Starting server on " << options.host << ":" << server.port()
                          << (server.is_secure() ? " with TLS" : "");
  server.wait();
}

} // namespace server
} // namespace rcopy
