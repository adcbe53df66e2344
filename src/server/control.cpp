#include "server/control.hpp"
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace rcopy {
namespace server {

namespace {

// Sessions may still be running and logging, so static destructors must not run
void exit_process() {
  boost::log::core::get()->flush();
  std::cout.flush();
  std::cerr.flush();
  std::_Exit(0);
}

} // namespace

//==============================================
// PING
//==============================================

rpc::PingResponse handle_ping(const rpc::PingRequest& request) {
  BOOST_LOG_TRIVIAL(info) << "Control: Received ping: " << request.message;
  rpc::PingResponse response;
  response.message = PING_REPLY;
  return response;
}

//==============================================
// SHUTDOWN
//==============================================

ShutdownController::ShutdownController(std::chrono::milliseconds delay, TerminateFunction terminate)
  : delay_(delay)
  , terminate_(std::move(terminate))
  , scheduled_(false) {
  if (!terminate_) {
    terminate_ = exit_process;
  }
}

rpc::ShutdownResponse ShutdownController::handle_shutdown(const rpc::ShutdownRequest&) {
  BOOST_LOG_TRIVIAL(info) << "Control: Shutdown requested";
  return rpc::ShutdownResponse();
}

void ShutdownController::schedule() {
  bool expected = false;
  if (!scheduled_.compare_exchange_strong(expected, true)) {
    BOOST_LOG_TRIVIAL(debug) << "Control: Shutdown already scheduled";
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Control: Shutting down in " << delay_.count() << " ms";

  // The timer thread owns copies so it never touches this object
  auto delay = delay_;
  auto terminate = terminate_;
  std::thread([delay, terminate]() {
    std::this_thread::sleep_for(delay);
    BOOST_LOG_TRIVIAL(info) << "Control: Shutting down server";
    terminate();
  }).detach();
}

} // namespace server
} // namespace rcopy
