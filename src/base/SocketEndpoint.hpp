#ifndef __MX_SOCKET_ENDPOINT__
#define __MX_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace mx {
/**
 * @brief A WebSocket server address split into the pieces the handshake
 * needs.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1), target("/"), secure(true) {}

  SocketEndpoint(const string &_name, int _port, const string &_target,
                 bool _secure)
      : name(_name), port(_port), target(_target), secure(_secure) {}

  /**
   * @brief Parses a `ws://` or `wss://` url.
   * @throws std::invalid_argument when the url has another scheme, no host or
   * a bad port.
   */
  static SocketEndpoint parse(const string &url);

  const string &getName() const { return name; }

  int getPort() const { return port; }

  const string &getTarget() const { return target; }

  bool isSecure() const { return secure; }

  /** @brief Host header value, with the port only when it is not the default.
   */
  string getHostHeader() const;

 protected:
  string name;
  int port;
  string target;
  bool secure;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  os << (self.isSecure() ? "wss://" : "ws://") << self.getName();
  if (self.getPort() >= 0) {
    os << ":" << self.getPort();
  }
  return os << self.getTarget();
}
}  // namespace mx

#endif  // __MX_SOCKET_ENDPOINT__
