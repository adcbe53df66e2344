#ifndef RCOPY_RPC_CODEC_HPP
#define RCOPY_RPC_CODEC_HPP

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <boost/endian/conversion.hpp>
#include "network/connection.hpp"
#include "rpc/frame.hpp"
#include "rpc/messages.hpp"
#include "rpc/status.hpp"

namespace rcopy {
namespace rpc {

class Codec {
public:
  // ---- FRAMING ----
  // Writes header and payload. Throws TransferError, or ProtocolError for oversized payloads.
  static void write_frame(network::Connection& connection, FrameType type, const std::string& payload);
  // Reads one frame. Throws TransferError on transport failure, ProtocolError on a bad header.
  static Frame read_frame(network::Connection& connection);


  // ---- SERIALIZATION ----
  static std::string serialize(Method method);
  static std::string serialize(const Status& status);
  static std::string serialize(const FileUploadRequest& message);
  static std::string serialize(const FileUploadResponse& message);
  static std::string serialize(const FileDownloadRequest& message);
  static std::string serialize(const FileDownloadResponse& message);
  static std::string serialize(const PingRequest& message);
  static std::string serialize(const PingResponse& message);
  static std::string serialize(const ShutdownRequest& message);
  static std::string serialize(const ShutdownResponse& message);


  // ---- DESERIALIZATION ----
  // Each throws ProtocolError when the payload is truncated or has trailing bytes
  static void deserialize(const std::string& payload, Method& method);
  static void deserialize(const std::string& payload, Status& status);
  static void deserialize(const std::string& payload, FileUploadRequest& message);
  static void deserialize(const std::string& payload, FileUploadResponse& message);
  static void deserialize(const std::string& payload, FileDownloadRequest& message);
  static void deserialize(const std::string& payload, FileDownloadResponse& message);
  static void deserialize(const std::string& payload, PingRequest& message);
  static void deserialize(const std::string& payload, PingResponse& message);
  static void deserialize(const std::string& payload, ShutdownRequest& message);
  static void deserialize(const std::string& payload, ShutdownResponse& message);

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  // Length-prefixed string or bytes field
  static void write_string(std::ostream& output, const std::string& value);
  static std::string read_string(std::istream& input);

  static void write_int64(std::ostream& output, int64_t value);
  static int64_t read_int64(std::istream& input);

  // Fails if anything is left after the last field
  static void expect_end(std::istream& input);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint64_t to_network_order(uint64_t host_value) {
    return boost::endian::native_to_big(host_value);
  }


  // ---- NETWORK TO HOST BYTE ORDER CONVERSION ----
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
  static uint64_t from_network_order(uint64_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace rpc
} // namespace rcopy

#endif // RCOPY_RPC_CODEC_HPP
