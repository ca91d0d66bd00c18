#include "core/ink_browser.h"
#include "core/ink_errors.h"
#include "network/ink_websocket.h"
#include "util/logger.h"

namespace ink {

TransportFactory DefaultTransportFactory() {
  return [](const Endpoint& endpoint) -> std::unique_ptr<Transport> {
    return WebSocket::Connect(endpoint, kDefaultConnectTimeoutMs);
  };
}

Browser::Browser(const Endpoint& browser_endpoint, TransportFactory factory)
    : endpoint_(browser_endpoint),
      factory_(factory ? std::move(factory) : DefaultTransportFactory()) {}

Browser::~Browser() {
  Disconnect();
}

void Browser::Connect() {
  Disconnect();

  LOG_INFO("Browser", "Connecting to dev protocol on '" + endpoint_.ToString() + "'");
  browser_client_.reset(new DevToolsClient(factory_(endpoint_), "browser"));
}

bool Browser::IsConnected() const {
  return browser_client_ && browser_client_->IsConnected();
}

void Browser::OpenPage(const CountdownTimer* timer) {
  ClosePage();

  json result = browser_client().SendCommand("Target.createTarget",
                                             {{"url", "about:blank"}},
                                             kDefaultConnectTimeoutMs, timer);
  target_id_ = result.value("targetId", std::string());
  if (target_id_.empty()) {
    throw ProtocolConnectionError("Target.createTarget returned no targetId");
  }

  Endpoint page_endpoint = endpoint_.WithPath("/devtools/page/" + target_id_);
  page_client_.reset(new DevToolsClient(factory_(page_endpoint), "page"));
  LOG_INFO("Browser", "Connected to page target " + target_id_);
}

void Browser::ClosePage() {
  if (page_client_) {
    page_client_->Close();
    page_client_.reset();
  }
  if (target_id_.empty()) {
    return;
  }

  std::string target_id = target_id_;
  target_id_.clear();
  if (!browser_client_ || !browser_client_->IsConnected()) {
    return;
  }
  try {
    browser_client_->SendCommand("Target.closeTarget", {{"targetId", target_id}},
                                 kBrowserCloseTimeoutMs);
  } catch (const InkError& e) {
    LOG_WARN("Browser", "Could not close page target " + target_id + ": " + e.what());
  }
}

DevToolsClient& Browser::browser_client() {
  if (!browser_client_) {
    throw ProtocolConnectionError("Not connected to the browser");
  }
  return *browser_client_;
}

DevToolsClient& Browser::page_client() {
  if (!page_client_) {
    throw ProtocolConnectionError("Not connected to a page");
  }
  return *page_client_;
}

void Browser::Close() {
  if (browser_client_ && browser_client_->IsConnected()) {
    try {
      browser_client_->SendCommand("Browser.close", json::object(), kBrowserCloseTimeoutMs);
    } catch (const ProtocolConnectionError& e) {
      // The browser usually drops the socket before it answers
      LOG_DEBUG("Browser", std::string("Browser.close: ") + e.what());
    } catch (const InkError& e) {
      LOG_WARN("Browser", std::string("Browser.close failed: ") + e.what());
    }
  }
  Disconnect();
}

void Browser::Disconnect() {
  if (page_client_) {
    page_client_->Close();
    page_client_.reset();
  }
  target_id_.clear();
  if (browser_client_) {
    browser_client_->Close();
    browser_client_.reset();
  }
}

}  // namespace ink
