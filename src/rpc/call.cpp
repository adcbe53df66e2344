#include "rpc/call.hpp"
#include <boost/log/trivial.hpp>

namespace rcopy {
namespace rpc {

ClientCall::ClientCall(std::unique_ptr<network::Connection> connection, Method method)
  : connection_(std::move(connection))
  , method_(method) {
  BOOST_LOG_TRIVIAL(debug) << "Call: Starting " << method_to_string(method_) << " call to " << connection_->remote_endpoint();
  Codec::write_frame(*connection_, FrameType::CALL, Codec::serialize(method_));
}

ClientCall::~ClientCall() {
  connection_->close();
}

void ClientCall::half_close() {
  Codec::write_frame(*connection_, FrameType::HALF_CLOSE, std::string());
}

void ClientCall::finish() {
  while (!finished_) {
    Frame frame = Codec::read_frame(*connection_);
    if (frame.type == FrameType::MESSAGE) {
      throw ProtocolError("unexpected message after the response");
    }
    accept_status(frame);
  }

  if (!status_.ok()) {
    BOOST_LOG_TRIVIAL(debug) << "Call: " << method_to_string(method_) << " failed with "
                             << status_code_to_string(status_.code) << ": " << status_.message;
    throw RpcError(status_);
  }
  BOOST_LOG_TRIVIAL(debug) << "Call: " << method_to_string(method_) << " completed";
}

void ClientCall::accept_status(const Frame& frame) {
  if (frame.type != FrameType::STATUS) {
    throw ProtocolError(std::string("unexpected ") + frame_type_to_string(frame.type) + " frame from server");
  }
  Codec::deserialize(frame.payload, status_);
  finished_ = true;
}

} // namespace rpc
} // namespace rcopy
