#ifndef RCOPY_NETWORK_LISTENER_HPP
#define RCOPY_NETWORK_LISTENER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "crypto/certificate.hpp"
#include "network/connection.hpp"
#include "network/network_error.hpp"

namespace rcopy {
namespace network {

struct ListenerOptions {
  std::string host = "localhost";
  uint16_t port = 0;
  crypto::TlsOptions tls;
};

class Listener {
public:
  using AcceptHandler = std::function<void(std::unique_ptr<Connection>)>;

  virtual ~Listener() = default;

  // Accepts connections on the io_context thread until close(). Each one is
  // handed to the handler before its handshake.
  virtual void start_accept(AcceptHandler handler) = 0;
  virtual void close() = 0;

  virtual uint16_t port() const = 0;
  virtual bool is_secure() const = 0;
};


// Plain TCP acceptor. Binding happens in the constructor.
class TcpListener : public Listener {
public:
  using SocketHandler = std::function<void(boost::asio::ip::tcp::socket)>;

  TcpListener(boost::asio::io_context& io_context, const std::string& host, uint16_t port);
  ~TcpListener() override;

  void start_accept(AcceptHandler handler) override;
  // Same accept loop, handing out raw sockets for an outer layer to wrap
  void start_accept_sockets(SocketHandler handler);
  void close() override;

  uint16_t port() const override { return port_; }
  bool is_secure() const override { return false; }

private:
  boost::asio::io_context& io_context_;
  boost::asio::ip::tcp::acceptor acceptor_;
  uint16_t port_;

  void accept_next(SocketHandler handler);
};


// Adds a TLS server layer on top of every connection accepted by the inner listener
class TlsListener : public Listener {
public:
  TlsListener(std::unique_ptr<TcpListener> inner, std::shared_ptr<boost::asio::ssl::context> context);

  void start_accept(AcceptHandler handler) override;
  void close() override { inner_->close(); }

  uint16_t port() const override { return inner_->port(); }
  bool is_secure() const override { return true; }

private:
  std::unique_ptr<TcpListener> inner_;
  std::shared_ptr<boost::asio::ssl::context> context_;
};


// Binds host:port (BindError on failure), then wraps it in TLS when enabled.
// Without TLS the plain listener is returned and a warning is logged.
std::unique_ptr<Listener> make_listener(boost::asio::io_context& io_context, const ListenerOptions& options);

} // namespace network
} // namespace rcopy

#endif // RCOPY_NETWORK_LISTENER_HPP
