#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "crypto/certificate.hpp"
#include "network/connection.hpp"
#include "network/listener.hpp"
#include "rpc/messages.hpp"
#include "rpc/status.hpp"
#include "server/control.hpp"
#include "transfer/transfer_options.hpp"

namespace rcopy {
namespace server {

constexpr uint16_t DEFAULT_PORT = 8022;

struct ServerOptions {
  std::string host = "localhost";
  uint16_t port = DEFAULT_PORT;
  crypto::TlsOptions tls;
  transfer::TransferOptions transfer;
  std::chrono::milliseconds shutdown_delay = DEFAULT_SHUTDOWN_DELAY;
  // Runs when a Shutdown call's timer fires. Empty exits the process.
  ShutdownController::TerminateFunction terminate;
};

class FileTransferServer {
public:

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileTransferServer(ServerOptions options);
  ~FileTransferServer();

  FileTransferServer(const FileTransferServer&) = delete;
  FileTransferServer& operator=(const FileTransferServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the listener and starts accepting. Throws BindError or a CertificateError.
  void start();
  // Blocks until stop()
  void wait();
  // Closes the listener and joins every session thread
  void stop();


  // ---- GETTERS ----
  uint16_t port() const;
  bool is_secure() const;
  bool is_running() const;

private:

  // ---- PARAMETERS ----
  const ServerOptions options_;

  // Server state
  mutable std::mutex mutex_;
  std::condition_variable stopped_cv_;
  bool is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<std::thread> io_thread_;
  std::unique_ptr<network::Listener> listener_;

  // Sessions, one thread per accepted connection
  uint64_t next_session_id_;
  std::map<uint64_t, std::thread> sessions_;
  std::vector<uint64_t> finished_sessions_;

  ShutdownController shutdown_;


  // ---- SESSIONS ----
  void on_accept(std::unique_ptr<network::Connection> connection);
  void run_session(uint64_t id, std::unique_ptr<network::Connection> connection);
  // Joins threads of sessions that have already returned
  void reap_finished_sessions();


  // ---- DISPATCH ----
  // Serves one call and returns the status to send back
  rpc::Status dispatch(rpc::Method method, network::Connection& connection);
  void serve_upload(network::Connection& connection);
  void serve_download(network::Connection& connection);
  void serve_ping(network::Connection& connection);
  void serve_shutdown(network::Connection& connection);
};

// Maps a handler failure to the status reported to the client
rpc::Status status_from_exception(const std::exception& error);

// Starts a server, logs, and blocks until it stops
void run_server(const ServerOptions& options);

} // namespace server
} // namespace rcopy
