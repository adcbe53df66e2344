#include "rpc/codec.hpp"
#include <boost/log/trivial.hpp>
#include <array>
#include <cstring>
#include <sstream>

namespace rcopy {
namespace rpc {

//==============================================
// FRAMING
//==============================================

void Codec::write_frame(network::Connection& connection, FrameType type, const std::string& payload) {
  if (payload.size() > MAX_FRAME_PAYLOAD) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Refusing to send " << payload.size() << " byte payload";
    throw ProtocolError("payload of " + std::to_string(payload.size()) + " bytes exceeds frame limit");
  }

  std::array<uint8_t, FRAME_HEADER_SIZE> header;
  header[0] = static_cast<uint8_t>(type);
  uint32_t network_length = to_network_order(static_cast<uint32_t>(payload.size()));
  std::memcpy(header.data() + 1, &network_length, sizeof(network_length));

  BOOST_LOG_TRIVIAL(trace) << "Codec: Writing " << frame_type_to_string(type) << " frame, payload " << payload.size() << " bytes";
  connection.write_all(header.data(), header.size());
  if (!payload.empty()) {
    connection.write_all(payload.data(), payload.size());
  }
}

Frame Codec::read_frame(network::Connection& connection) {
  std::array<uint8_t, FRAME_HEADER_SIZE> header;
  connection.read_exactly(header.data(), header.size());

  if (header[0] > static_cast<uint8_t>(FrameType::STATUS)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unknown frame type: " << static_cast<int>(header[0]);
    throw ProtocolError("unknown frame type " + std::to_string(header[0]));
  }

  uint32_t network_length;
  std::memcpy(&network_length, header.data() + 1, sizeof(network_length));
  std::size_t length = from_network_order(network_length);
  if (length > MAX_FRAME_PAYLOAD) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Frame payload too large: " << length;
    throw ProtocolError("frame payload of " + std::to_string(length) + " bytes exceeds limit");
  }

  Frame frame;
  frame.type = static_cast<FrameType>(header[0]);
  frame.payload.resize(length);
  if (length > 0) {
    connection.read_exactly(&frame.payload[0], length);
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Read " << frame_type_to_string(frame.type) << " frame, payload " << length << " bytes";
  return frame;
}

//==============================================
// SERIALIZATION
//==============================================

std::string Codec::serialize(Method method) {
  return std::string(1, static_cast<char>(method));
}

std::string Codec::serialize(const Status& status) {
  std::ostringstream output;
  uint8_t code = static_cast<uint8_t>(status.code);
  write_bytes(output, &code, sizeof(code));
  write_string(output, status.message);
  return output.str();
}

std::string Codec::serialize(const FileUploadRequest& message) {
  std::ostringstream output;
  write_string(output, message.filename);
  write_string(output, message.content);
  write_int64(output, message.size);
  return output.str();
}

std::string Codec::serialize(const FileUploadResponse& message) {
  std::ostringstream output;
  write_string(output, message.message);
  return output.str();
}

std::string Codec::serialize(const FileDownloadRequest& message) {
  std::ostringstream output;
  write_string(output, message.filename);
  return output.str();
}

std::string Codec::serialize(const FileDownloadResponse& message) {
  std::ostringstream output;
  write_string(output, message.message);
  write_string(output, message.filename);
  write_string(output, message.content);
  write_int64(output, message.size);
  return output.str();
}

std::string Codec::serialize(const PingRequest& message) {
  std::ostringstream output;
  write_string(output, message.message);
  return output.str();
}

std::string Codec::serialize(const PingResponse& message) {
  std::ostringstream output;
  write_string(output, message.message);
  return output.str();
}

std::string Codec::serialize(const ShutdownRequest&) {
  return {};
}

std::string Codec::serialize(const ShutdownResponse&) {
  return {};
}

//==============================================
// DESERIALIZATION
//==============================================

void Codec::deserialize(const std::string& payload, Method& method) {
  if (payload.size() != 1) {
    throw ProtocolError("CALL payload must be a single byte");
  }
  uint8_t value = static_cast<uint8_t>(payload[0]);
  if (value > static_cast<uint8_t>(Method::SHUTDOWN)) {
    throw ProtocolError("unknown method " + std::to_string(value));
  }
  method = static_cast<Method>(value);
}

void Codec::deserialize(const std::string& payload, Status& status) {
  std::istringstream input(payload);
  uint8_t code;
  read_bytes(input, &code, sizeof(code));
  if (code > static_cast<uint8_t>(StatusCode::UNIMPLEMENTED)) {
    throw ProtocolError("unknown status code " + std::to_string(code));
  }
  status.code = static_cast<StatusCode>(code);
  status.message = read_string(input);
  expect_end(input);
}

void Codec::deserialize(const std::string& payload, FileUploadRequest& message) {
  std::istringstream input(payload);
  message.filename = read_string(input);
  message.content = read_string(input);
  message.size = read_int64(input);
  expect_end(input);
}

void Codec::deserialize(const std::string& payload, FileUploadResponse& message) {
  std::istringstream input(payload);
  message.message = read_string(input);
  expect_end(input);
}

void Codec::deserialize(const std::string& payload, FileDownloadRequest& message) {
  std::istringstream input(payload);
  message.filename = read_string(input);
  expect_end(input);
}

void Codec::deserialize(const std::string& payload, FileDownloadResponse& message) {
  std::istringstream input(payload);
  message.message = read_string(input);
  message.filename = read_string(input);
  message.content = read_string(input);
  message.size = read_int64(input);
  expect_end(input);
}

void Codec::deserialize(const std::string& payload, PingRequest& message) {
  std::istringstream input(payload);
  message.message = read_string(input);
  expect_end(input);
}

void Codec::deserialize(const std::string& payload, PingResponse& message) {
  std::istringstream input(payload);
  message.message = read_string(input);
  expect_end(input);
}

void Codec::deserialize(const std::string& payload, ShutdownRequest&) {
  if (!payload.empty()) {
    throw ProtocolError("shutdown request carries no fields");
  }
}

void Codec::deserialize(const std::string& payload, ShutdownResponse&) {
  if (!payload.empty()) {
    throw ProtocolError("shutdown response carries no fields");
  }
}

//==============================================
// STREAM OPERATIONS
//==============================================

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw std::runtime_error("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw ProtocolError("truncated message");
  }
}

void Codec::write_string(std::ostream& output, const std::string& value) {
  uint32_t network_length = to_network_order(static_cast<uint32_t>(value.size()));
  write_bytes(output, &network_length, sizeof(network_length));
  if (!value.empty()) {
    write_bytes(output, value.data(), value.size());
  }
}

std::string Codec::read_string(std::istream& input) {
  uint32_t network_length;
  read_bytes(input, &network_length, sizeof(network_length));
  std::size_t length = from_network_order(network_length);
  if (length > MAX_FRAME_PAYLOAD) {
    throw ProtocolError("field length " + std::to_string(length) + " exceeds frame limit");
  }

  std::string value(length, '\0');
  if (length > 0) {
    read_bytes(input, &value[0], length);
  }
  return value;
}

void Codec::write_int64(std::ostream& output, int64_t value) {
  uint64_t network_value = to_network_order(static_cast<uint64_t>(value));
  write_bytes(output, &network_value, sizeof(network_value));
}

int64_t Codec::read_int64(std::istream& input) {
  uint64_t network_value;
  read_bytes(input, &network_value, sizeof(network_value));
  return static_cast<int64_t>(from_network_order(network_value));
}

void Codec::expect_end(std::istream& input) {
  if (input.peek() != std::char_traits<char>::eof()) {
    throw ProtocolError("trailing bytes after message");
  }
}

} // namespace rpc
} // namespace rcopy
