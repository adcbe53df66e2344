#ifndef RCOPY_RPC_STATUS_HPP
#define RCOPY_RPC_STATUS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include "network/network_error.hpp"

namespace rcopy {
namespace rpc {

// Terminal outcome of a call, sent by the server in the STATUS frame
enum class StatusCode : uint8_t {
    OK = 0,
    CANCELLED,
    UNKNOWN,
    INVALID_ARGUMENT,
    NOT_FOUND,
    DATA_LOSS,
    INTERNAL,
    UNAVAILABLE,
    UNIMPLEMENTED
};

inline const char* status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK: return "OK";
        case StatusCode::CANCELLED: return "CANCELLED";
        case StatusCode::UNKNOWN: return "UNKNOWN";
        case StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND: return "NOT_FOUND";
        case StatusCode::DATA_LOSS: return "DATA_LOSS";
        case StatusCode::INTERNAL: return "INTERNAL";
        case StatusCode::UNAVAILABLE: return "UNAVAILABLE";
        case StatusCode::UNIMPLEMENTED: return "UNIMPLEMENTED";
        default: return "UNDEFINED";
    }
}

struct Status {
    StatusCode code = StatusCode::OK;
    std::string message;

    bool ok() const { return code == StatusCode::OK; }
};

// Peer sent bytes that do not form a valid frame or message
class ProtocolError : public network::TransferError {
public:
    explicit ProtocolError(const std::string& message)
        : network::TransferError("protocol violation: " + message) {}
};

// Client side: the server ended the call with a non-OK status
class RpcError : public std::runtime_error {
public:
    explicit RpcError(const Status& status)
        : std::runtime_error(std::string("RPC failed [") + status_code_to_string(status.code) + "]: " + status.message)
        , status_(status) {}

    StatusCode code() const { return status_.code; }
    const Status& status() const { return status_; }

private:
    Status status_;
};

} // namespace rpc
} // namespace rcopy

#endif // RCOPY_RPC_STATUS_HPP
