#ifndef RCOPY_RPC_FRAME_HPP
#define RCOPY_RPC_FRAME_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace rcopy {
namespace rpc {

// Frame type used to drive the call lifecycle
enum class FrameType : uint8_t {
    CALL = 0,        // client -> server, payload: method
    MESSAGE = 1,     // either direction, payload: encoded message
    HALF_CLOSE = 2,  // client -> server, no more messages follow
    STATUS = 3       // server -> client, terminal outcome
};

inline const char* frame_type_to_string(FrameType type) {
    switch (type) {
        case FrameType::CALL: return "CALL";
        case FrameType::MESSAGE: return "MESSAGE";
        case FrameType::HALF_CLOSE: return "HALF_CLOSE";
        case FrameType::STATUS: return "STATUS";
        default: return "UNKNOWN";
    }
}

// Wire layout: type (1 byte) | payload length (4 bytes, big endian) | payload
struct Frame {
    FrameType type = FrameType::MESSAGE;
    std::string payload;
};

constexpr std::size_t FRAME_HEADER_SIZE = 5;
constexpr std::size_t MAX_FRAME_PAYLOAD = 16 * 1024 * 1024;

} // namespace rpc
} // namespace rcopy

#endif // RCOPY_RPC_FRAME_HPP
