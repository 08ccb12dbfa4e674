#ifndef __VC_PIPE_SOCKET_HANDLER__
#define __VC_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace vc {
/**
 * @brief Handles Unix-domain stream sockets addressed by a filesystem path
 * (the endpoint name).
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket at endpoint.getName().
   * @return The connected fd, or -1 with errno describing the failure.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening socket at the path, replacing any stale file.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Closes the listening socket and removes the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /**
   * @brief Fills `addr` for `path`, failing with ENAMETOOLONG when it does
   * not fit in sun_path.
   */
  static bool fillAddress(const string& path, sockaddr_un* addr);

  map<string, set<int>> pipeServerSockets;
};
}  // namespace vc

#endif  // __VC_PIPE_SOCKET_HANDLER__
