#pragma once

#include "network/ink_endpoint.h"
#include "network/ink_transport.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ink {

// WebSocket opcodes (RFC 6455)
enum class WsOpcode : uint8_t {
  CONTINUATION = 0x0,
  TEXT = 0x1,
  BINARY = 0x2,
  CLOSE = 0x8,
  PING = 0x9,
  PONG = 0xA
};

// WebSocket close status codes (RFC 6455)
enum class WsCloseCode : uint16_t {
  NORMAL = 1000,
  GOING_AWAY = 1001,
  PROTOCOL_ERROR = 1002,
  MESSAGE_TOO_BIG = 1009
};

// Largest message accepted from the browser. Full page screenshots of long
// documents are delivered as a single base64 message.
constexpr uint64_t kWsMaxMessageSize = 256ull * 1024 * 1024;

// Client side of RFC 6455 over a plain TCP socket, enough for the DevTools
// endpoint on the loopback interface (no TLS, no extensions).
class WebSocket : public Transport {
 public:
  // Connects and performs the upgrade handshake within timeout_ms. Later
  // writes, the close frame included, give up after timeout_ms as well.
  // Throws ProtocolConnectionError.
  static std::unique_ptr<WebSocket> Connect(const Endpoint& endpoint, int timeout_ms);

  ~WebSocket() override;

  WebSocket(const WebSocket&) = delete;
  WebSocket& operator=(const WebSocket&) = delete;

  void Send(const std::string& message) override;
  bool Receive(std::string* message) override;
  void Close() override;

  // Value of Sec-WebSocket-Accept for a given Sec-WebSocket-Key
  static std::string ComputeAcceptKey(const std::string& key);

 private:
  WebSocket(int fd, std::string endpoint_text);

  void Handshake(const Endpoint& endpoint, int timeout_ms);
  void SetSendTimeout(int timeout_ms);
  void SendFrame(WsOpcode opcode, const std::string& payload);
  void WriteAll(const std::string& data);
  bool ReadExact(char* buffer, size_t length);

  int fd_;
  std::string endpoint_text_;
  std::string read_buffer_;  // Bytes received after the handshake headers
  std::mutex write_mutex_;
  std::atomic<bool> closed_{false};
};

}  // namespace ink
