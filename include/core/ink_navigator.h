#pragma once

#include "core/ink_devtools_client.h"
#include "core/ink_url_blacklist.h"
#include "util/ink_countdown_timer.h"
#include <cstdint>
#include <set>
#include <string>

namespace ink {

// Interval between window.status polls
constexpr int kWindowStatusPollIntervalMs = 10;

struct NavigationOptions {
  bool use_cache = false;

  // Extra bound on the load event after DOMContentLoaded; expiry is not an
  // error. Negative = wait for load as long as the countdown allows.
  int64_t media_load_timeout_ms = -1;

  UrlBlacklist blacklist;
  std::set<std::string> safe_urls;  // Never blocked
  bool log_network_traffic = false;
};

// Loads content into the page target and runs page-level scripts.
class Navigator {
 public:
  // `log_component` prefixes every log line (the converter's instance).
  Navigator(DevToolsClient& page, std::string log_component);

  // Replaces the main frame's document with `html`. No load events are
  // awaited.
  void SetDocumentContent(const std::string& html, const CountdownTimer* timer);

  // Navigates and waits for the page to load. Throws NavigationError when
  // the browser reports an errorText (including a blocked top-level URL).
  void NavigateTo(const std::string& url, const NavigationOptions& options,
                  const CountdownTimer* timer);

  // Polls window.status until it equals `status` or timeout_ms passes.
  // Returns whether it matched.
  bool WaitForWindowStatus(const std::string& status, int64_t timeout_ms);

  // Evaluates `script`, awaiting a returned promise. The value is discarded.
  // Throws ConversionError when the script throws.
  void RunJavascript(const std::string& script, const CountdownTimer* timer);

 private:
  void DisableInterception(bool fetch_enabled);

  DevToolsClient& page_;
  std::string log_component_;
};

}  // namespace ink
