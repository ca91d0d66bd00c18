#pragma once

#include "core/ink_devtools_client.h"
#include "network/ink_endpoint.h"
#include "network/ink_transport.h"
#include <memory>
#include <string>

namespace ink {

// Connection timeout used by the default WebSocket transport factory
constexpr int kDefaultConnectTimeoutMs = 10000;

// Bound for Browser.close and Target.closeTarget
constexpr int64_t kBrowserCloseTimeoutMs = 2000;

// Factory that opens real WebSocket connections.
TransportFactory DefaultTransportFactory();

// The DevTools connections a conversion needs: one to the browser endpoint
// (targets, shutdown), kept while the browser runs, and one to a page target
// (everything else), opened and closed per conversion. A fresh target per
// conversion keeps late events of an abandoned load away from the next one.
class Browser {
 public:
  Browser(const Endpoint& browser_endpoint, TransportFactory factory);
  ~Browser();

  Browser(const Browser&) = delete;
  Browser& operator=(const Browser&) = delete;

  // Connects to the browser endpoint. Throws ProtocolConnectionError.
  void Connect();

  bool IsConnected() const;

  // Creates an about:blank page target and connects to it, closing any page
  // still open. Throws ProtocolConnectionError, ProtocolTimeoutError,
  // ProtocolCommandError.
  void OpenPage(const CountdownTimer* timer);

  // Disconnects from the page and closes its target (best effort, bounded).
  // Idempotent.
  void ClosePage();

  DevToolsClient& browser_client();
  DevToolsClient& page_client();
  const std::string& target_id() const { return target_id_; }
  const Endpoint& endpoint() const { return endpoint_; }

  // Asks the browser to exit (best effort, bounded) and closes both
  // connections. Idempotent.
  void Close();

  // Closes both connections without asking the browser to exit.
  void Disconnect();

 private:
  Endpoint endpoint_;
  TransportFactory factory_;
  std::unique_ptr<DevToolsClient> browser_client_;
  std::unique_ptr<DevToolsClient> page_client_;
  std::string target_id_;
};

}  // namespace ink
