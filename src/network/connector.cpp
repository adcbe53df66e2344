#include "network/connector.hpp"
#include <boost/asio/ssl.hpp>
#include <boost/log/trivial.hpp>

namespace rcopy {
namespace network {

std::unique_ptr<Connection> connect(boost::asio::io_context& io_context,
                                    const std::string& host, uint16_t port, bool tls) {
  BOOST_LOG_TRIVIAL(debug) << "Connector: Resolving " << host << ":" << port;

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(io_context);
  auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Connector: Cannot resolve " << host << ": " << ec.message();
    throw TransferError("cannot resolve " + host + ": " + ec.message());
  }

  // Connect to the first available endpoint
  boost::asio::ip::tcp::socket socket(io_context);
  boost::asio::connect(socket, endpoints, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Connector: Connection to " << host << ":" << port << " failed: " << ec.message();
    throw TransferError("cannot connect to " + host + ":" + std::to_string(port) + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Connector: Connected to " << host << ":" << port;

  if (!tls) {
    return std::make_unique<PlainConnection>(std::move(socket));
  }

  auto context = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);
  context->set_options(boost::asio::ssl::context::default_workarounds |
                       boost::asio::ssl::context::no_sslv2 |
                       boost::asio::ssl::context::no_sslv3 |
                       boost::asio::ssl::context::no_tlsv1 |
                       boost::asio::ssl::context::no_tlsv1_1);
  // Self-signed servers cannot be authenticated, so the peer certificate is accepted as is
  context->set_verify_mode(boost::asio::ssl::verify_none);
  BOOST_LOG_TRIVIAL(warning) << "Connector: TLS to " << host << " without server certificate verification";

  auto connection = std::make_unique<TlsConnection>(std::move(socket), context,
                                                    boost::asio::ssl::stream_base::client);
  connection->set_server_name(host);
  connection->handshake();
  return connection;
}

} // namespace network
} // namespace rcopy
