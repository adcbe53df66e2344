#include "network/connection.hpp"
#include <boost/log/trivial.hpp>

namespace rcopy {
namespace network {

namespace {

std::string describe_endpoint(const boost::asio::ip::tcp::socket& socket) {
  boost::system::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// Frames carry their own end markers, so closing skips the TLS close_notify exchange
void close_socket(boost::asio::ip::tcp::socket& socket) {
  if (!socket.is_open()) {
    return;
  }
  boost::system::error_code ec;
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "Connection: Socket shutdown error: " << ec.message();
  }
  socket.close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Connection: Socket close error: " << ec.message();
  }
}

std::string read_failure(const boost::system::error_code& ec, std::size_t got, std::size_t wanted) {
  if (ec == boost::asio::error::eof || ec == boost::asio::ssl::error::stream_truncated) {
    return "connection closed by peer after " + std::to_string(got) + " of " +
           std::to_string(wanted) + " bytes";
  }
  return "read failed: " + ec.message();
}

} // namespace

//==============================================
// PLAIN TCP CONNECTION
//==============================================

PlainConnection::PlainConnection(boost::asio::ip::tcp::socket socket)
  : socket_(std::move(socket)) {
  remote_endpoint_ = describe_endpoint(socket_);
  BOOST_LOG_TRIVIAL(debug) << "Connection: Plain connection with " << remote_endpoint_;
}

PlainConnection::~PlainConnection() {
  close();
}

void PlainConnection::read_exactly(void* data, std::size_t size) {
  boost::system::error_code ec;
  std::size_t got = boost::asio::read(socket_, boost::asio::buffer(data, size), ec);
  if (ec || got != size) {
    throw TransferError(read_failure(ec, got, size));
  }
}

void PlainConnection::write_all(const void* data, std::size_t size) {
  boost::system::error_code ec;
  std::size_t written = boost::asio::write(socket_, boost::asio::buffer(data, size), ec);
  if (ec || written != size) {
    throw TransferError("write failed after " + std::to_string(written) + " of " +
                        std::to_string(size) + " bytes: " + ec.message());
  }
}

void PlainConnection::close() {
  close_socket(socket_);
}

//==============================================
// TLS CONNECTION
//==============================================

TlsConnection::TlsConnection(boost::asio::ip::tcp::socket socket,
                             std::shared_ptr<boost::asio::ssl::context> context,
                             Role role)
  : context_(std::move(context))
  , stream_(std::move(socket), *context_)
  , role_(role) {
  remote_endpoint_ = describe_endpoint(stream_.next_layer());
  BOOST_LOG_TRIVIAL(debug) << "Connection: TLS connection with " << remote_endpoint_;
}

TlsConnection::~TlsConnection() {
  close();
}

void TlsConnection::set_server_name(const std::string& host) {
  if (!SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str())) {
    BOOST_LOG_TRIVIAL(warning) << "Connection: Could not set TLS server name: " << host;
  }
}

void TlsConnection::handshake() {
  if (handshake_done_) {
    return;
  }

  boost::system::error_code ec;
  stream_.handshake(role_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Connection: TLS handshake with " << remote_endpoint_ << " failed: " << ec.message();
    throw TransferError("TLS handshake failed: " + ec.message());
  }
  handshake_done_ = true;
  BOOST_LOG_TRIVIAL(debug) << "Connection: TLS handshake with " << remote_endpoint_ << " complete";
}

void TlsConnection::read_exactly(void* data, std::size_t size) {
  handshake();
  boost::system::error_code ec;
  std::size_t got = boost::asio::read(stream_, boost::asio::buffer(data, size), ec);
  if (ec || got != size) {
    throw TransferError(read_failure(ec, got, size));
  }
}

void TlsConnection::write_all(const void* data, std::size_t size) {
  handshake();
  boost::system::error_code ec;
  std::size_t written = boost::asio::write(stream_, boost::asio::buffer(data, size), ec);
  if (ec || written != size) {
    throw TransferError("write failed after " + std::to_string(written) + " of " +
                        std::to_string(size) + " bytes: " + ec.message());
  }
}

void TlsConnection::close() {
  close_socket(stream_.next_layer());
}

} // namespace network
} // namespace rcopy
