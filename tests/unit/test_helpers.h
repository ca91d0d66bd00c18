#pragma once

#include "network/ink_transport.h"
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ink {
namespace test {

using json = nlohmann::json;

// Writes an executable shell script and returns its path.
std::string WriteScript(const std::string& dir, const std::string& name, const std::string& body);

// A stand-in browser that announces ws://127.0.0.1:9222/devtools/browser/fake
// on stderr (or writes DevToolsActivePort into --user-data-dir) and then
// sleeps until it is killed.
std::string WriteFakeChrome(const std::string& dir);

// In-memory transport. Messages sent by the client are recorded and handed
// to an optional handler, which answers with Reply()/Deliver().
class FakeTransport {
 public:
  using CommandHandler = std::function<void(FakeTransport& transport, const json& command)>;

  explicit FakeTransport(CommandHandler handler = CommandHandler());

  void Send(const std::string& message);
  bool Receive(std::string* message);
  void Close();

  // Queues an inbound message for the client
  void Deliver(const std::string& raw);
  void Deliver(const json& message) { Deliver(message.dump()); }
  void Reply(const json& command, const json& result);
  void ReplyError(const json& command, int code, const std::string& message);

  // Makes a blocked Receive() throw ProtocolConnectionError
  void Fault();

  std::vector<json> sent() const;

  // First sent command with `method`, waiting up to timeout_ms for it;
  // null when none arrived
  json WaitForSent(const std::string& method, int timeout_ms);

  bool closed() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> inbound_;
  std::vector<json> sent_;
  bool closed_ = false;
  bool faulted_ = false;
  CommandHandler handler_;
};

// Transport handed to DevToolsClient; the FakeTransport stays reachable from
// the test after the client is gone.
class SharedTransport : public Transport {
 public:
  explicit SharedTransport(std::shared_ptr<FakeTransport> core) : core_(std::move(core)) {}

  void Send(const std::string& message) override { core_->Send(message); }
  bool Receive(std::string* message) override { return core_->Receive(message); }
  void Close() override { core_->Close(); }

 private:
  std::shared_ptr<FakeTransport> core_;
};

// Answers the DevTools commands a conversion sends, the way a headless
// browser would, and records them.
class ScriptedBrowser : public std::enable_shared_from_this<ScriptedBrowser> {
 public:
  struct Command {
    std::string endpoint_path;
    json message;
  };

  // Behavior, set before converting
  bool fire_dom_content_event = true;
  bool fire_load_event = true;
  std::string navigate_error_text;
  std::string window_status;
  std::string script_exception;
  std::string pdf_bytes = "%PDF-1.4 fake document";
  std::string png_bytes = std::string("\x89PNG\r\n\x1a\n", 8) + "fake image";
  std::string mhtml = "MIME-Version: 1.0\r\nContent-Type: multipart/related\r\n\r\nfake";
  std::vector<std::string> subresources;  // Paused with Fetch.requestPaused after navigating
  // Before answering Page.navigate, the page that took the previous
  // navigation fires its (late) load event
  bool late_load_event_from_previous_page = false;

  TransportFactory Factory();

  std::vector<Command> commands() const;
  std::vector<json> Commands(const std::string& method) const;
  bool Received(const std::string& method) const { return !Commands(method).empty(); }
  int connection_count() const;

  // Closes every open connection as if the browser dropped them
  void DropConnections();

 private:
  void Handle(const std::string& path, FakeTransport& transport, const json& command);
  void HandleBrowser(FakeTransport& transport, const json& command);
  void HandlePage(const std::string& path, FakeTransport& transport, const json& command);

  struct Connection {
    std::string endpoint_path;
    std::shared_ptr<FakeTransport> transport;
  };

  mutable std::mutex mutex_;
  std::vector<Command> commands_;
  std::vector<Connection> connections_;
  std::string last_navigated_path_;
  int next_target_ = 1;
  bool fetch_enabled_ = false;
};

}  // namespace test
}  // namespace ink
