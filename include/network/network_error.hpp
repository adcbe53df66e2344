#ifndef RCOPY_NETWORK_ERROR_HPP
#define RCOPY_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace rcopy {
namespace network {

// Listener could not be bound (port in use, permission denied, bad address)
class BindError : public std::runtime_error {
public:
    explicit BindError(const std::string& message)
        : std::runtime_error("Bind error: " + message) {}
};

// Transport failure in the middle of a session
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error("Transfer error: " + message) {}
};

} // namespace network
} // namespace rcopy

#endif // RCOPY_NETWORK_ERROR_HPP
