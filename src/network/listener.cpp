#include "network/listener.hpp"
#include <boost/log/trivial.hpp>

namespace rcopy {
namespace network {

//==============================================
// PLAIN TCP LISTENER
//==============================================

TcpListener::TcpListener(boost::asio::io_context& io_context, const std::string& host, uint16_t port)
  : io_context_(io_context)
  , acceptor_(io_context)
  , port_(port) {
  BOOST_LOG_TRIVIAL(debug) << "Listener: Binding " << host << ":" << port;

  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(host, std::to_string(port),
                                    boost::asio::ip::tcp::resolver::passive, ec);
  if (ec || endpoints.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Listener: Cannot resolve " << host << ": " << ec.message();
    throw BindError("cannot resolve " + host + ": " + ec.message());
  }

  boost::asio::ip::tcp::endpoint endpoint = endpoints.begin()->endpoint();

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Listener: Failed to listen on " << host << ":" << port << ": " << ec.message();
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    throw BindError("failed to listen on " + host + ":" + std::to_string(port) + ": " + ec.message());
  }

  // Port 0 asks the OS to choose
  port_ = acceptor_.local_endpoint().port();
  BOOST_LOG_TRIVIAL(info) << "Listener: Listening on " << endpoint.address().to_string() << ":" << port_;
}

TcpListener::~TcpListener() {
  close();
}

void TcpListener::start_accept(AcceptHandler handler) {
  start_accept_sockets([handler](boost::asio::ip::tcp::socket socket) {
    handler(std::make_unique<PlainConnection>(std::move(socket)));
  });
}

void TcpListener::start_accept_sockets(SocketHandler handler) {
  accept_next(std::move(handler));
}

void TcpListener::accept_next(SocketHandler handler) {
  if (!acceptor_.is_open()) {
    return;
  }

  acceptor_.async_accept(
    [this, handler](const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket) {
      if (ec == boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(debug) << "Listener: Accept cancelled";
        return;
      }
      if (!ec) {
        BOOST_LOG_TRIVIAL(debug) << "Listener: Accepted connection";
        try {
          handler(std::move(socket));
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "Listener: Connection handler failed: " << e.what();
        }
      } else {
        BOOST_LOG_TRIVIAL(error) << "Listener: Accept error: " << ec.message();
      }
      accept_next(handler);  // Continue accepting new connections
    });
}

void TcpListener::close() {
  if (acceptor_.is_open()) {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Listener: Error closing acceptor: " << ec.message();
    }
  }
}

//==============================================
// TLS LISTENER
//==============================================

TlsListener::TlsListener(std::unique_ptr<TcpListener> inner, std::shared_ptr<boost::asio::ssl::context> context)
  : inner_(std::move(inner))
  , context_(std::move(context)) {
}

void TlsListener::start_accept(AcceptHandler handler) {
  auto context = context_;
  inner_->start_accept_sockets([handler, context](boost::asio::ip::tcp::socket socket) {
    handler(std::make_unique<TlsConnection>(std::move(socket), context,
                                            boost::asio::ssl::stream_base::server));
  });
}

//==============================================
// LISTENER CONSTRUCTION
//==============================================

std::unique_ptr<Listener> make_listener(boost::asio::io_context& io_context, const ListenerOptions& options) {
  auto listener = std::make_unique<TcpListener>(io_context, options.host, options.port);

  if (!options.tls.enabled) {
    BOOST_LOG_TRIVIAL(warning) << "Listener: Running server without TLS";
    return listener;
  }

  auto material = crypto::CertificateProvisioner::provision(options.tls);
  auto context = crypto::CertificateProvisioner::make_server_context(material);
  BOOST_LOG_TRIVIAL(info) << "Listener: TLS enabled"
                          << (material.self_signed ? " with a self-signed certificate" : "");
  return std::make_unique<TlsListener>(std::move(listener), std::move(context));
}

} // namespace network
} // namespace rcopy
