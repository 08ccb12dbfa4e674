#ifndef __VC_UNIX_SOCKET_HANDLER__
#define __VC_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace vc {
/**
 * @brief POSIX SocketHandler base shared by the Unix-domain and TCP handlers.
 *
 * Every socket created or accepted through the handler is tracked with its
 * own mutex so that a reader thread and a writer thread never interleave
 * partial operations on one descriptor.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes, retrying on EAGAIN for up to 5 seconds. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void close(int fd);

 protected:
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, no SIGPIPE).
   */
  virtual void initSocket(int fd);
  /**
   * @brief Adds reusable flags for listening sockets.
   */
  virtual void initServerSocket(int fd);

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace vc

#endif  // __VC_UNIX_SOCKET_HANDLER__
