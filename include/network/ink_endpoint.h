#pragma once

#include <string>

namespace ink {

// Where a DevTools WebSocket is reachable: ws://host:port/path
struct Endpoint {
  std::string host;
  int port = 0;
  std::string path;  // Always starts with '/'

  std::string ToString() const;

  // Same host and port, different path (used to reach a page target from
  // the browser endpoint).
  Endpoint WithPath(const std::string& new_path) const;

  // Accepts "ws://host:port/path" (path optional). Returns false for other
  // schemes, a missing host, or a port outside 1..65535.
  static bool Parse(const std::string& url, Endpoint* out);
};

}  // namespace ink
