#ifndef RCOPY_NETWORK_CONNECTOR_HPP
#define RCOPY_NETWORK_CONNECTOR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "network/connection.hpp"

namespace rcopy {
namespace network {

// Opens a client connection, completing the TLS handshake when tls is set.
// The server certificate is not verified: self-signed servers cannot be authenticated.
std::unique_ptr<Connection> connect(boost::asio::io_context& io_context,
                                    const std::string& host, uint16_t port, bool tls);

} // namespace network
} // namespace rcopy

#endif // RCOPY_NETWORK_CONNECTOR_HPP
