#ifndef __VC_SOCKET_BRIDGE_HPP__
#define __VC_SOCKET_BRIDGE_HPP__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace vc {
/**
 * @brief Exposes a Unix-domain console socket on an ephemeral TCP port for
 * viewers that only speak TCP.
 *
 * The bridge is single use: it accepts exactly one TCP client, relays bytes
 * both ways on two threads, and ends as soon as either direction reaches
 * end-of-stream or fails.
 */
class SocketBridge {
 public:
  SocketBridge(shared_ptr<SocketHandler> _pipeSocketHandler,
               shared_ptr<SocketHandler> _tcpSocketHandler,
               const string& _bindAddress = "127.0.0.1");
  ~SocketBridge();

  SocketBridge(const SocketBridge&) = delete;
  SocketBridge& operator=(const SocketBridge&) = delete;

  /**
   * @brief Connects to `unixPath`, starts listening and returns the TCP port
   * without waiting for a client.
   * @throws ConsoleConnectException if the console socket cannot be reached.
   * @throws std::runtime_error if the TCP listener cannot be created.
   */
  int start(const string& unixPath);

  /** @brief Blocks until the bridge has ended. */
  void wait();

  /** @brief Ends the bridge (closing any relayed connection) and waits. */
  void shutdown();

  bool isFinished() const { return finished; }
  int getPort() const { return port; }
  bool hasAcceptedClient() const { return acceptedClient; }

 protected:
  void serve();
  /** @brief Waits for the single TCP client. Returns -1 when shut down. */
  int acceptClient();
  void relay(shared_ptr<SocketHandler> srcHandler, int srcFd,
             shared_ptr<SocketHandler> dstHandler, int dstFd,
             const string& direction);
  /** @brief Shuts both relayed sockets down so each relay wakes and ends. */
  void stopRelays();

  shared_ptr<SocketHandler> pipeSocketHandler;
  shared_ptr<SocketHandler> tcpSocketHandler;
  string bindAddress;
  int port;
  int unixFd;
  int listenFd;
  int clientFd;
  /** @brief Self-pipe used to interrupt the accept wait. */
  int wakeFds[2];
  std::thread bridgeThread;
  std::mutex fdMutex;
  std::atomic<bool> stopping;
  std::atomic<bool> finished;
  std::atomic<bool> acceptedClient;
};
}  // namespace vc

#endif  // __VC_SOCKET_BRIDGE_HPP__
