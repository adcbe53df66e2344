#ifndef RCOPY_RPC_CALL_HPP
#define RCOPY_RPC_CALL_HPP

#include <memory>
#include <string>
#include "network/connection.hpp"
#include "rpc/codec.hpp"
#include "rpc/frame.hpp"
#include "rpc/messages.hpp"
#include "rpc/status.hpp"

namespace rcopy {
namespace rpc {

//==============================================
// SERVER SIDE STREAM INTERFACES
//==============================================

// Inbound side of a client-streaming call
template <typename Request>
class ServerReader {
public:
  virtual ~ServerReader() = default;

  // Reads the next message. Returns false once the client has half-closed.
  // Transport failures throw network::TransferError.
  virtual bool read(Request& message) = 0;
};

// Outbound side of a server-streaming call
template <typename Response>
class ServerWriter {
public:
  virtual ~ServerWriter() = default;

  // Sends one message. Transport failures throw network::TransferError.
  virtual void write(const Response& message) = 0;
};


template <typename Request>
class ConnectionReader : public ServerReader<Request> {
public:
  explicit ConnectionReader(network::Connection& connection) : connection_(connection) {}

  bool read(Request& message) override {
    if (half_closed_) {
      return false;
    }

    Frame frame = Codec::read_frame(connection_);
    switch (frame.type) {
      case FrameType::MESSAGE:
        Codec::deserialize(frame.payload, message);
        return true;
      case FrameType::HALF_CLOSE:
        half_closed_ = true;
        return false;
      default:
        throw ProtocolError(std::string("unexpected ") + frame_type_to_string(frame.type) + " frame");
    }
  }

private:
  network::Connection& connection_;
  bool half_closed_ = false;
};


template <typename Response>
class ConnectionWriter : public ServerWriter<Response> {
public:
  explicit ConnectionWriter(network::Connection& connection) : connection_(connection) {}

  void write(const Response& message) override {
    Codec::write_frame(connection_, FrameType::MESSAGE, Codec::serialize(message));
  }

private:
  network::Connection& connection_;
};

//==============================================
// CLIENT SIDE CALL
//==============================================

/**
 * One outgoing call over its own connection.
 * The CALL frame is sent on construction; the connection is closed on destruction.
 */
class ClientCall {
public:
  ClientCall(std::unique_ptr<network::Connection> connection, Method method);
  ~ClientCall();

  ClientCall(const ClientCall&) = delete;
  ClientCall& operator=(const ClientCall&) = delete;

  template <typename Request>
  void send(const Request& message) {
    Codec::write_frame(*connection_, FrameType::MESSAGE, Codec::serialize(message));
  }

  // Tells the server no more messages follow
  void half_close();

  // Reads the next response message. Returns false when the terminal status arrives instead.
  template <typename Response>
  bool receive(Response& message) {
    if (finished_) {
      return false;
    }
    Frame frame = Codec::read_frame(*connection_);
    if (frame.type == FrameType::MESSAGE) {
      Codec::deserialize(frame.payload, message);
      return true;
    }
    accept_status(frame);
    return false;
  }

  // Waits for the terminal status. Throws RpcError unless it is OK.
  void finish();

  const Status& status() const { return status_; }

private:
  std::unique_ptr<network::Connection> connection_;
  Method method_;
  bool finished_ = false;
  Status status_;

  void accept_status(const Frame& frame);
};

} // namespace rpc
} // namespace rcopy

#endif // RCOPY_RPC_CALL_HPP
