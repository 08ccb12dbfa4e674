#ifndef __VC_SOCKET_ENDPOINT__
#define __VC_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace vc {
/**
 * @brief Address of a console: either a Unix-domain socket path (port < 0) or
 * a TCP host and port.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  explicit SocketEndpoint(const string &_name) : name(_name), port(-1) {}

  explicit SocketEndpoint(int _port) : name(""), port(_port) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  bool isUnixPath() const { return port < 0; }

  bool operator==(const SocketEndpoint &other) const {
    return name == other.name && port == other.port;
  }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace vc

#endif  // __VC_SOCKET_ENDPOINT__
