#include "core/ink_navigator.h"
#include "core/ink_errors.h"
#include "util/logger.h"
#include <chrono>
#include <memory>
#include <thread>

namespace ink {

namespace {

// Everything the event listener needs, owned by the listener itself so a
// late event can never reach state of a finished navigation.
struct RequestFilter {
  DevToolsClient* page;
  std::string log_component;
  UrlBlacklist blacklist;
  std::set<std::string> safe_urls;
  bool intercepting;
  bool log_traffic;

  void OnEvent(const json& event) {
    std::string method = event.value("method", std::string());
    const json params = event.value("params", json::object());

    if (method == "Fetch.requestPaused") {
      OnRequestPaused(params);
    } else if (log_traffic) {
      LogTraffic(method, params);
    }
  }

  void OnRequestPaused(const json& params) {
    std::string request_id = params.value("requestId", std::string());
    std::string url;
    auto request_it = params.find("request");
    if (request_it != params.end() && request_it->is_object()) {
      url = request_it->value("url", std::string());
    }

    if (intercepting && blacklist.ShouldBlock(url, safe_urls)) {
      if (log_traffic) {
        LOG_INFO(log_component, "The url '" + url + "' has been blocked by url blacklist pattern");
      }
      page->PostCommand("Fetch.failRequest",
                        {{"requestId", request_id}, {"errorReason", "BlockedByClient"}});
      return;
    }

    if (log_traffic) {
      LOG_INFO(log_component, "The url '" + url + "' is allowed");
    }
    page->PostCommand("Fetch.continueRequest", {{"requestId", request_id}});
  }

  void LogTraffic(const std::string& method, const json& params) {
    if (method == "Network.requestWillBeSent") {
      const json request = params.value("request", json::object());
      LOG_INFO(log_component, "Request " + request.value("method", std::string("GET")) + " '" +
               request.value("url", std::string()) + "'");
    } else if (method == "Network.responseReceived") {
      const json response = params.value("response", json::object());
      LOG_INFO(log_component, "Response " + std::to_string(response.value("status", 0)) + " '" +
               response.value("url", std::string()) + "'");
    } else if (method == "Network.loadingFailed") {
      LOG_INFO(log_component, "Loading failed for request " + params.value("requestId", std::string()) +
               ": " + params.value("errorText", std::string()) +
               (params.value("blockedReason", std::string()).empty()
                    ? "" : " (" + params.value("blockedReason", std::string()) + ")"));
    }
  }
};

}  // namespace

Navigator::Navigator(DevToolsClient& page, std::string log_component)
    : page_(page), log_component_(std::move(log_component)) {}

void Navigator::SetDocumentContent(const std::string& html, const CountdownTimer* timer) {
  json frame_tree = page_.SendCommand("Page.getFrameTree", json::object(), -1, timer);
  std::string frame_id;
  auto tree_it = frame_tree.find("frameTree");
  if (tree_it != frame_tree.end() && tree_it->contains("frame")) {
    frame_id = (*tree_it)["frame"].value("id", std::string());
  }
  if (frame_id.empty()) {
    throw ConversionError("Page.getFrameTree returned no main frame");
  }

  page_.SendCommand("Page.setDocumentContent", {{"frameId", frame_id}, {"html", html}}, -1, timer);
  LOG_INFO(log_component_, "Document content set on frame " + frame_id);
}

void Navigator::NavigateTo(const std::string& url, const NavigationOptions& options,
                           const CountdownTimer* timer) {
  bool intercept = !options.blacklist.empty();

  auto filter = std::make_shared<RequestFilter>();
  filter->page = &page_;
  filter->log_component = log_component_;
  filter->blacklist = options.blacklist;
  filter->safe_urls = options.safe_urls;
  filter->intercepting = intercept;
  filter->log_traffic = options.log_network_traffic;
  page_.SetEventListener([filter](const json& event) { filter->OnEvent(event); });

  EventWaiterPtr dom_loaded;
  EventWaiterPtr loaded;
  try {
    page_.SendCommand("Network.enable", json::object(), -1, timer);
    page_.SendCommand("Network.setCacheDisabled", {{"cacheDisabled", !options.use_cache}}, -1, timer);

    if (intercept) {
      page_.SendCommand("Fetch.enable", {{"patterns", json::array({{{"urlPattern", "*"}}})}}, -1, timer);
    }

    page_.SendCommand("Page.enable", json::object(), -1, timer);

    dom_loaded = page_.ExpectEvent(EventMatcher("Page.domContentEventFired"));
    loaded = page_.ExpectEvent(EventMatcher("Page.loadEventFired"));

    json result = page_.SendCommand("Page.navigate", {{"url", url}}, -1, timer);
    std::string error_text = result.value("errorText", std::string());
    if (!error_text.empty()) {
      throw NavigationError("Navigation to '" + url + "' failed: " + error_text);
    }

    page_.WaitForEvent(dom_loaded, -1, timer);
    dom_loaded.reset();
    LOG_INFO(log_component_, "DOMContentLoaded fired for '" + url + "'");

    try {
      page_.WaitForEvent(loaded, options.media_load_timeout_ms, timer);
    } catch (const ProtocolTimeoutError& e) {
      if (e.countdown_expired() || options.media_load_timeout_ms < 0) {
        throw;
      }
      LOG_WARN(log_component_, "Media load timed out after " +
               std::to_string(options.media_load_timeout_ms) + " ms, continuing");
    }
    loaded.reset();
  } catch (const InkError&) {
    if (dom_loaded) page_.CancelEvent(dom_loaded);
    if (loaded) page_.CancelEvent(loaded);
    DisableInterception(intercept);
    throw;
  }

  DisableInterception(intercept);
}

void Navigator::DisableInterception(bool fetch_enabled) {
  page_.ClearEventListener();
  if (!fetch_enabled || !page_.IsConnected()) {
    return;
  }
  try {
    page_.SendCommand("Fetch.disable", json::object(), 5000);
  } catch (const InkError& e) {
    LOG_WARN(log_component_, std::string("Fetch.disable failed: ") + e.what());
  }
}

bool Navigator::WaitForWindowStatus(const std::string& status, int64_t timeout_ms) {
  auto start = std::chrono::steady_clock::now();
  json params = {{"expression", "window.status"}, {"returnByValue", true}};

  while (true) {
    int64_t elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    int64_t remaining = timeout_ms - elapsed;
    if (remaining <= 0) {
      return false;
    }

    json result;
    try {
      result = page_.SendCommand("Runtime.evaluate", params, remaining);
    } catch (const ProtocolTimeoutError&) {
      return false;
    }

    auto value_it = result.find("result");
    if (value_it != result.end() && value_it->is_object()) {
      auto value = value_it->find("value");
      if (value != value_it->end() && value->is_string() && value->get<std::string>() == status) {
        return true;
      }
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(kWindowStatusPollIntervalMs));
  }
}

void Navigator::RunJavascript(const std::string& script, const CountdownTimer* timer) {
  json result = page_.SendCommand("Runtime.evaluate",
                                  {{"expression", script}, {"awaitPromise", true}}, -1, timer);

  auto details = result.find("exceptionDetails");
  if (details == result.end()) {
    return;
  }

  std::string description = details->value("text", std::string("Uncaught"));
  auto exception = details->find("exception");
  if (exception != details->end() && exception->is_object()) {
    description = exception->value("description", description);
  }
  throw ConversionError("Script failed: " + description);
}

}  // namespace ink
