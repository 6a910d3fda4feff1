#include "SocketEndpoint.hpp"

namespace mx {
SocketEndpoint SocketEndpoint::parse(const string &url) {
  bool secure;
  string rest;
  if (url.rfind("wss://", 0) == 0) {
    secure = true;
    rest = url.substr(6);
  } else if (url.rfind("ws://", 0) == 0) {
    secure = false;
    rest = url.substr(5);
  } else {
    throw std::invalid_argument("Unsupported url scheme: " + url);
  }

  string authority = rest;
  string target = "/";
  auto slash = rest.find('/');
  if (slash != string::npos) {
    authority = rest.substr(0, slash);
    target = rest.substr(slash);
  }

  string host = authority;
  int port = secure ? 443 : 80;
  auto colon = authority.rfind(':');
  if (colon != string::npos) {
    host = authority.substr(0, colon);
    string portString = authority.substr(colon + 1);
    try {
      size_t consumed = 0;
      port = stoi(portString, &consumed);
      if (consumed != portString.length()) {
        throw std::invalid_argument(portString);
      }
    } catch (const std::logic_error &) {
      throw std::invalid_argument("Invalid port in url: " + url);
    }
    if (port <= 0 || port > 65535) {
      throw std::invalid_argument("Invalid port in url: " + url);
    }
  }
  if (host.empty()) {
    throw std::invalid_argument("Missing host in url: " + url);
  }
  return SocketEndpoint(host, port, target, secure);
}

string SocketEndpoint::getHostHeader() const {
  if ((secure && port == 443) || (!secure && port == 80) || port < 0) {
    return name;
  }
  return name + ":" + to_string(port);
}
}  // namespace mx
