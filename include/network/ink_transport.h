#pragma once

#include <functional>
#include <memory>
#include <string>

namespace ink {

struct Endpoint;

// A message channel to one DevTools target. Implementations must allow
// Send() and Close() to be called from other threads while a Receive() is
// blocked, and Close() must make that Receive() return.
class Transport {
 public:
  virtual ~Transport() = default;

  // Sends one complete text message. Throws ProtocolConnectionError.
  virtual void Send(const std::string& message) = 0;

  // Blocks until a complete text message arrives. Returns false once the
  // channel is closed (by either side). Throws ProtocolConnectionError on
  // a faulted connection.
  virtual bool Receive(std::string* message) = 0;

  // Idempotent.
  virtual void Close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const Endpoint& endpoint)>;

}  // namespace ink
