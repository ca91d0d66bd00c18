#include "network/ink_websocket.h"
#include "core/ink_errors.h"
#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <chrono>
#include <functional>
#include <future>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace ink {
namespace {

// Accepts one WebSocket client on the loopback interface, answers the
// upgrade and then hands the connection to a script.
class LoopbackServer {
 public:
  LoopbackServer() {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in address = {};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0;
    socklen_t length = sizeof(address);
    if (listen_fd_ < 0 ||
        bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) != 0 ||
        listen(listen_fd_, 1) != 0 ||
        getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&address), &length) != 0) {
      throw std::runtime_error("Could not listen on the loopback interface");
    }
    port_ = ntohs(address.sin_port);
  }

  ~LoopbackServer() {
    if (thread_.joinable()) thread_.join();
    close(listen_fd_);
  }

  void Serve(std::function<void(int fd)> script) {
    thread_ = std::thread([this, script] {
      int fd = accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) return;
      if (Upgrade(fd)) {
        script(fd);
      }
      close(fd);
    });
  }

  Endpoint endpoint() const {
    Endpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = port_;
    endpoint.path = "/devtools/browser/loopback";
    return endpoint;
  }

  static void SendBytes(int fd, const std::string& bytes) {
    ASSERT_EQ(send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL), static_cast<ssize_t>(bytes.size()));
  }

  // Reads and drops everything until the client shuts the connection down
  static void DrainUntilClosed(int fd) {
    char buffer[4096];
    while (recv(fd, buffer, sizeof(buffer), 0) > 0) {
    }
  }

 private:
  static bool Upgrade(int fd) {
    std::string request;
    char buffer[1024];
    while (request.find("\r\n\r\n") == std::string::npos) {
      ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
      if (n <= 0) return false;
      request.append(buffer, static_cast<size_t>(n));
    }

    const std::string header = "Sec-WebSocket-Key: ";
    size_t start = request.find(header);
    if (start == std::string::npos) return false;
    start += header.size();
    std::string key = request.substr(start, request.find("\r\n", start) - start);

    std::string response =
        "HTTP/1.1 101 Switching Protocols\r\n"
        "Upgrade: websocket\r\n"
        "Connection: Upgrade\r\n"
        "Sec-WebSocket-Accept: " + WebSocket::ComputeAcceptKey(key) + "\r\n"
        "\r\n";
    return send(fd, response.data(), response.size(), MSG_NOSIGNAL) ==
           static_cast<ssize_t>(response.size());
  }

  int listen_fd_ = -1;
  int port_ = 0;
  std::thread thread_;
};

TEST(WebSocketTest, ReceivesTextFrame) {
  LoopbackServer server;
  server.Serve([](int fd) {
    LoopbackServer::SendBytes(fd, std::string("\x81\x05hello", 7));
    LoopbackServer::DrainUntilClosed(fd);
  });

  std::unique_ptr<WebSocket> socket = WebSocket::Connect(server.endpoint(), 2000);
  std::string message;
  ASSERT_TRUE(socket->Receive(&message));
  EXPECT_EQ(message, "hello");
  socket->Close();
}

TEST(WebSocketTest, FragmentedMessageIsReassembled) {
  LoopbackServer server;
  server.Serve([](int fd) {
    LoopbackServer::SendBytes(fd, std::string("\x01\x03" "hel", 5));
    LoopbackServer::SendBytes(fd, std::string("\x80\x03" "lo!", 5));
    LoopbackServer::DrainUntilClosed(fd);
  });

  std::unique_ptr<WebSocket> socket = WebSocket::Connect(server.endpoint(), 2000);
  std::string message;
  ASSERT_TRUE(socket->Receive(&message));
  EXPECT_EQ(message, "hello!");
  socket->Close();
}

TEST(WebSocketTest, ContinuationLengthNearTheLimitOfUint64IsRejected) {
  LoopbackServer server;
  server.Serve([](int fd) {
    // One byte of a fragmented message, then a continuation claiming
    // 2^64 - 1 bytes
    LoopbackServer::SendBytes(fd, std::string("\x01\x01" "a", 3));
    LoopbackServer::SendBytes(fd, std::string("\x80\x7f\xff\xff\xff\xff\xff\xff\xff\xff", 10));
    LoopbackServer::DrainUntilClosed(fd);
  });

  std::unique_ptr<WebSocket> socket = WebSocket::Connect(server.endpoint(), 2000);
  std::string message;
  EXPECT_THROW(socket->Receive(&message), ProtocolConnectionError);
  socket->Close();
}

TEST(WebSocketTest, StalledPeerDoesNotBlockSendOrClose) {
  LoopbackServer server;
  // Destroyed before the server joins its thread, which wakes the script
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  server.Serve([released](int) {
    // Never reads, so the client's send buffer fills up
    released.wait();
  });

  std::unique_ptr<WebSocket> socket = WebSocket::Connect(server.endpoint(), 300);
  auto start = std::chrono::steady_clock::now();

  std::string large(64 * 1024 * 1024, 'x');
  EXPECT_THROW(socket->Send(large), ProtocolConnectionError);
  EXPECT_THROW(socket->Send("{}"), ProtocolConnectionError);
  socket->Close();

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  EXPECT_LT(elapsed, 10000);

  release.set_value();
}

}  // namespace
}  // namespace ink
