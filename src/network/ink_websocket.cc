#include "network/ink_websocket.h"
#include "core/ink_errors.h"
#include "util/ink_encoding.h"
#include "util/logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace ink {

namespace {

const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string Trim(const std::string& text) {
  size_t start = text.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

// Waits until fd is ready for `events` or the deadline passes.
bool PollUntil(int fd, short events, std::chrono::steady_clock::time_point deadline) {
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
      return false;
    }
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    int result = poll(&pfd, 1, static_cast<int>(remaining));
    if (result > 0) {
      return true;
    }
    if (result < 0 && errno != EINTR) {
      return false;
    }
  }
}

int ConnectTcp(const Endpoint& endpoint, std::chrono::steady_clock::time_point deadline) {
  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* addresses = nullptr;
  std::string port = std::to_string(endpoint.port);
  int rc = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &addresses);
  if (rc != 0) {
    throw ProtocolConnectionError("Could not resolve '" + endpoint.host + "': " + gai_strerror(rc));
  }

  std::string last_error = "no address";
  int fd = -1;
  for (struct addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
    fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = strerror(errno);
      continue;
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    bool connected = connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
    if (!connected && errno == EINPROGRESS && PollUntil(fd, POLLOUT, deadline)) {
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      connected = so_error == 0;
      if (!connected) last_error = strerror(so_error);
    } else if (!connected) {
      last_error = errno == EINPROGRESS ? "connect timed out" : strerror(errno);
    }

    if (connected) {
      fcntl(fd, F_SETFL, flags);
      int one = 1;
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      break;
    }
    close(fd);
    fd = -1;
  }
  freeaddrinfo(addresses);

  if (fd < 0) {
    throw ProtocolConnectionError("Could not connect to " + endpoint.ToString() + ": " + last_error);
  }
  return fd;
}

}  // namespace

std::string WebSocket::ComputeAcceptKey(const std::string& key) {
  return Base64Encode(Sha1Digest(key + kWebSocketGuid));
}

std::unique_ptr<WebSocket> WebSocket::Connect(const Endpoint& endpoint, int timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  int fd = ConnectTcp(endpoint, deadline);

  std::unique_ptr<WebSocket> socket(new WebSocket(fd, endpoint.ToString()));
  socket->Handshake(endpoint, timeout_ms);
  socket->SetSendTimeout(timeout_ms);
  LOG_DEBUG("WebSocket", "Connected to " + endpoint.ToString());
  return socket;
}

WebSocket::WebSocket(int fd, std::string endpoint_text)
    : fd_(fd), endpoint_text_(std::move(endpoint_text)) {}

WebSocket::~WebSocket() {
  Close();
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
}

void WebSocket::Handshake(const Endpoint& endpoint, int timeout_ms) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  std::string key = Base64Encode(RandomBytes(16));

  std::string request =
      "GET " + endpoint.path + " HTTP/1.1\r\n"
      "Host: " + endpoint.host + ":" + std::to_string(endpoint.port) + "\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Key: " + key + "\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "\r\n";
  WriteAll(request);

  std::string response;
  char buffer[4096];
  size_t header_end = std::string::npos;
  while (header_end == std::string::npos) {
    if (!PollUntil(fd_, POLLIN, deadline)) {
      throw ProtocolConnectionError("WebSocket handshake with " + endpoint_text_ + " timed out");
    }
    ssize_t n = recv(fd_, buffer, sizeof(buffer), 0);
    if (n == 0) {
      throw ProtocolConnectionError("Connection closed during WebSocket handshake with " + endpoint_text_);
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      throw ProtocolConnectionError("WebSocket handshake failed: " + std::string(strerror(errno)));
    }
    response.append(buffer, static_cast<size_t>(n));
    header_end = response.find("\r\n\r\n");
    if (header_end == std::string::npos && response.size() > 64 * 1024) {
      throw ProtocolConnectionError("WebSocket handshake response too large");
    }
  }

  read_buffer_ = response.substr(header_end + 4);
  std::string headers = response.substr(0, header_end);

  size_t line_end = headers.find("\r\n");
  std::string status_line = headers.substr(0, line_end);
  if (status_line.find(" 101") == std::string::npos) {
    throw ProtocolConnectionError("WebSocket upgrade refused by " + endpoint_text_ + ": " + status_line);
  }

  std::string accept;
  size_t pos = line_end == std::string::npos ? headers.size() : line_end + 2;
  while (pos < headers.size()) {
    size_t next = headers.find("\r\n", pos);
    std::string line = headers.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
    size_t colon = line.find(':');
    if (colon != std::string::npos &&
        ToLower(Trim(line.substr(0, colon))) == "sec-websocket-accept") {
      accept = Trim(line.substr(colon + 1));
    }
    if (next == std::string::npos) break;
    pos = next + 2;
  }

  if (accept != ComputeAcceptKey(key)) {
    throw ProtocolConnectionError("Invalid Sec-WebSocket-Accept from " + endpoint_text_);
  }
}

void WebSocket::SetSendTimeout(int timeout_ms) {
  struct timeval timeout;
  timeout.tv_sec = timeout_ms / 1000;
  timeout.tv_usec = (timeout_ms % 1000) * 1000;
  if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) != 0) {
    throw ProtocolConnectionError("Could not set the send timeout on " + endpoint_text_ + ": " +
                                  strerror(errno));
  }
}

void WebSocket::WriteAll(const std::string& data) {
  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t n = send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        // A partly written frame leaves the stream unusable
        closed_ = true;
        shutdown(fd_, SHUT_RDWR);
        throw ProtocolConnectionError("Write to " + endpoint_text_ + " timed out, the peer stopped reading");
      }
      throw ProtocolConnectionError("Write to " + endpoint_text_ + " failed: " + strerror(errno));
    }
    offset += static_cast<size_t>(n);
  }
}

bool WebSocket::ReadExact(char* buffer, size_t length) {
  size_t filled = 0;
  if (!read_buffer_.empty()) {
    filled = std::min(length, read_buffer_.size());
    memcpy(buffer, read_buffer_.data(), filled);
    read_buffer_.erase(0, filled);
  }

  while (filled < length) {
    ssize_t n = recv(fd_, buffer + filled, length - filled, 0);
    if (n == 0) {
      return false;
    }
    if (n < 0) {
      if (errno == EINTR) continue;
      if (closed_) return false;  // Our own shutdown() woke the reader
      throw ProtocolConnectionError("Read from " + endpoint_text_ + " failed: " + strerror(errno));
    }
    filled += static_cast<size_t>(n);
  }
  return true;
}

void WebSocket::SendFrame(WsOpcode opcode, const std::string& payload) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));  // FIN

  uint64_t length = payload.size();
  if (length < 126) {
    frame.push_back(static_cast<char>(0x80 | length));
  } else if (length <= 0xFFFF) {
    frame.push_back(static_cast<char>(0x80 | 126));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
  } else {
    frame.push_back(static_cast<char>(0x80 | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((length >> shift) & 0xFF));
    }
  }

  // Client frames are always masked
  std::string mask = RandomBytes(4);
  frame += mask;
  for (size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  WriteAll(frame);
}

void WebSocket::Send(const std::string& message) {
  if (closed_) {
    throw ProtocolConnectionError("WebSocket to " + endpoint_text_ + " is closed");
  }
  SendFrame(WsOpcode::TEXT, message);
}

bool WebSocket::Receive(std::string* message) {
  message->clear();
  bool in_fragmented_message = false;

  while (true) {
    unsigned char header[2];
    if (!ReadExact(reinterpret_cast<char*>(header), 2)) {
      return false;
    }

    bool fin = (header[0] & 0x80) != 0;
    WsOpcode opcode = static_cast<WsOpcode>(header[0] & 0x0F);
    bool masked = (header[1] & 0x80) != 0;
    uint64_t length = header[1] & 0x7F;

    if (length == 126) {
      unsigned char ext[2];
      if (!ReadExact(reinterpret_cast<char*>(ext), 2)) return false;
      length = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
    } else if (length == 127) {
      unsigned char ext[8];
      if (!ReadExact(reinterpret_cast<char*>(ext), 8)) return false;
      length = 0;
      for (int i = 0; i < 8; ++i) {
        length = (length << 8) | ext[i];
      }
    }

    if (length > kWsMaxMessageSize - message->size()) {
      throw ProtocolConnectionError("Message from " + endpoint_text_ + " exceeds " +
                                    std::to_string(kWsMaxMessageSize) + " bytes");
    }

    unsigned char mask[4] = {0, 0, 0, 0};
    if (masked && !ReadExact(reinterpret_cast<char*>(mask), 4)) {
      return false;
    }

    std::string payload(static_cast<size_t>(length), '\0');
    if (length > 0 && !ReadExact(&payload[0], payload.size())) {
      return false;
    }
    if (masked) {
      for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
      }
    }

    switch (opcode) {
      case WsOpcode::TEXT:
      case WsOpcode::BINARY:
        *message = std::move(payload);
        in_fragmented_message = !fin;
        if (fin) return true;
        break;

      case WsOpcode::CONTINUATION:
        if (!in_fragmented_message) {
          throw ProtocolConnectionError("Unexpected continuation frame from " + endpoint_text_);
        }
        message->append(payload);
        if (fin) return true;
        break;

      case WsOpcode::PING:
        SendFrame(WsOpcode::PONG, payload);
        break;

      case WsOpcode::PONG:
        break;

      case WsOpcode::CLOSE: {
        LOG_DEBUG("WebSocket", "Close frame received from " + endpoint_text_);
        bool expected = false;
        if (closed_.compare_exchange_strong(expected, true)) {
          // Echo the status code back, then stop both directions
          std::string reply = payload.size() >= 2 ? payload.substr(0, 2) : std::string();
          try {
            SendFrame(WsOpcode::CLOSE, reply);
          } catch (const ProtocolConnectionError& e) {
            LOG_DEBUG("WebSocket", std::string("Close reply not sent: ") + e.what());
          }
          shutdown(fd_, SHUT_RDWR);
        }
        return false;
      }

      default:
        throw ProtocolConnectionError("Unknown WebSocket opcode " +
                                      std::to_string(static_cast<int>(opcode)) +
                                      " from " + endpoint_text_);
    }
  }
}

void WebSocket::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true)) {
    return;
  }

  uint16_t code = static_cast<uint16_t>(WsCloseCode::NORMAL);
  std::string payload;
  payload.push_back(static_cast<char>(code >> 8));
  payload.push_back(static_cast<char>(code & 0xFF));
  try {
    SendFrame(WsOpcode::CLOSE, payload);
  } catch (const ProtocolConnectionError& e) {
    LOG_DEBUG("WebSocket", std::string("Close frame not sent: ") + e.what());
  }

  // Wakes a reader blocked in recv(); the descriptor itself is released in
  // the destructor once no thread can be using it.
  shutdown(fd_, SHUT_RDWR);
}

}  // namespace ink
