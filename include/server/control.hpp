#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include "rpc/messages.hpp"

namespace rcopy {
namespace server {

constexpr const char* PING_REPLY = "pong";
constexpr std::chrono::milliseconds DEFAULT_SHUTDOWN_DELAY{1000};


// ---- PING ----
// Logs the caller's message and answers "pong" whatever it was
rpc::PingResponse handle_ping(const rpc::PingRequest& request);


// ---- SHUTDOWN ----
class ShutdownController {
public:
  using TerminateFunction = std::function<void()>;

  // An empty terminate function flushes the log and exits the process with
  // status 0 without running static destructors
  explicit ShutdownController(std::chrono::milliseconds delay = DEFAULT_SHUTDOWN_DELAY,
                              TerminateFunction terminate = TerminateFunction());

  rpc::ShutdownResponse handle_shutdown(const rpc::ShutdownRequest& request);

  // Starts a detached timer that runs the terminate function after the delay.
  // Called once the response has been delivered. Later calls are ignored.
  void schedule();

  bool is_scheduled() const { return scheduled_.load(); }
  std::chrono::milliseconds delay() const { return delay_; }

private:
  std::chrono::milliseconds delay_;
  TerminateFunction terminate_;
  std::atomic<bool> scheduled_;
};

} // namespace server
} // namespace rcopy
