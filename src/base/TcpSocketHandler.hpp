#ifndef __VC_TCP_SOCKET_HANDLER__
#define __VC_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace vc {
/**
 * @brief Implements IPv4/IPv6 socket operations built on top of
 * UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects to the first address that
   * accepts.
   * @return The connected fd, or -1 with errno set from the last attempt.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint.
   *
   * An empty name binds every interface.  Port 0 asks the kernel for an
   * ephemeral port; only the first resolved address is bound in that case so
   * that every returned fd shares one port.  Use getBoundPort() to learn it.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

  /** @brief Returns the local port a socket is bound to. */
  static int getBoundPort(int fd);

 protected:
  /** @brief Listening sockets, keyed by requested port and bind name. */
  map<pair<string, int>, set<int>> portServerSockets;

  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace vc

#endif  // __VC_TCP_SOCKET_HANDLER__
