#include "network/ink_endpoint.h"
#include <cctype>

namespace ink {

std::string Endpoint::ToString() const {
  return "ws://" + host + ":" + std::to_string(port) + path;
}

Endpoint Endpoint::WithPath(const std::string& new_path) const {
  Endpoint copy = *this;
  copy.path = new_path.empty() || new_path[0] != '/' ? "/" + new_path : new_path;
  return copy;
}

bool Endpoint::Parse(const std::string& url, Endpoint* out) {
  static const std::string kScheme = "ws://";
  if (url.compare(0, kScheme.size(), kScheme) != 0) {
    return false;
  }

  size_t authority_start = kScheme.size();
  size_t path_start = url.find('/', authority_start);
  std::string authority = url.substr(authority_start,
      path_start == std::string::npos ? std::string::npos : path_start - authority_start);

  size_t colon = authority.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= authority.size()) {
    return false;
  }

  std::string port_text = authority.substr(colon + 1);
  for (char c : port_text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  if (port_text.size() > 5) {
    return false;
  }
  int port = std::stoi(port_text);
  if (port <= 0 || port > 65535) {
    return false;
  }

  out->host = authority.substr(0, colon);
  out->port = port;
  out->path = path_start == std::string::npos ? "/" : url.substr(path_start);
  return true;
}

}  // namespace ink
