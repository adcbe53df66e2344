#ifndef RCOPY_NETWORK_CONNECTION_HPP
#define RCOPY_NETWORK_CONNECTION_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include "network/network_error.hpp"

namespace rcopy {
namespace network {

// Blocking byte stream carrying one RPC session. Every failure is a TransferError.
class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    virtual ~Connection() = default;

    
    // ---- SESSION SETUP ----
    // Completes the security handshake. No-op for plain TCP.
    virtual void handshake() = 0;

    
    // ---- DATA TRANSFER ----
    // Reads exactly size bytes. End of stream before that is an error.
    virtual void read_exactly(void* data, std::size_t size) = 0;
    // Writes all size bytes before returning
    virtual void write_all(const void* data, std::size_t size) = 0;

    
    // ---- TEARDOWN ----
    virtual void close() = 0;

    
    // ---- GETTERS ----
    virtual bool is_secure() const = 0;
    const std::string& remote_endpoint() const { return remote_endpoint_; }

protected:
    Connection() = default;
    std::string remote_endpoint_;
};


class PlainConnection : public Connection {
public:
    explicit PlainConnection(boost::asio::ip::tcp::socket socket);
    ~PlainConnection() override;

    void handshake() override {}
    void read_exactly(void* data, std::size_t size) override;
    void write_all(const void* data, std::size_t size) override;
    void close() override;
    bool is_secure() const override { return false; }

private:
    boost::asio::ip::tcp::socket socket_;
};


class TlsConnection : public Connection {
public:
    using Role = boost::asio::ssl::stream_base::handshake_type;

    // The context is shared with the listener or client that created the connection
    TlsConnection(boost::asio::ip::tcp::socket socket,
                  std::shared_ptr<boost::asio::ssl::context> context,
                  Role role);
    ~TlsConnection() override;

    void handshake() override;
    void read_exactly(void* data, std::size_t size) override;
    void write_all(const void* data, std::size_t size) override;
    void close() override;
    bool is_secure() const override { return true; }

    // Sets the SNI host name a client presents during the handshake
    void set_server_name(const std::string& host);

private:
    std::shared_ptr<boost::asio::ssl::context> context_;
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket> stream_;
    Role role_;
    bool handshake_done_ = false;
};

} // namespace network
} // namespace rcopy

#endif // RCOPY_NETWORK_CONNECTION_HPP
