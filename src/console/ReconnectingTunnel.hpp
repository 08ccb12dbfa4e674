#ifndef __VC_RECONNECTING_TUNNEL_HPP__
#define __VC_RECONNECTING_TUNNEL_HPP__

#include "Headers.hpp"
#include "ReconnectPolicy.hpp"
#include "SocketHandler.hpp"
#include "StreamProxy.hpp"

namespace vc {
/**
 * @brief Thrown when a console endpoint could not be reached before the
 * reconnect delay passed its ceiling.
 */
class ConsoleConnectException : public std::runtime_error {
 public:
  explicit ConsoleConnectException(const string& msg)
      : std::runtime_error(msg) {}
};

struct TunnelOptions {
  std::chrono::milliseconds initialDelay =
      std::chrono::milliseconds(DEFAULT_INITIAL_RECONNECT_DELAY_MS);
  std::chrono::milliseconds retryCeiling =
      std::chrono::milliseconds(DEFAULT_RETRY_CEILING_MS);
  size_t blockSize = DEFAULT_PROXY_BLOCK_SIZE;
};

/**
 * @brief Connects to a text console and proxies it to the local terminal,
 * reconnecting when the connection drops.
 *
 * The caller is expected to hold a RawTerminalSession around run().
 */
class ReconnectingTunnel {
 public:
  typedef std::function<void(std::chrono::milliseconds)> Sleeper;

  ReconnectingTunnel(shared_ptr<SocketHandler> _socketHandler,
                     const SocketEndpoint& _endpoint,
                     const TunnelOptions& _options = TunnelOptions(),
                     int _localInFd = STDIN_FILENO,
                     int _localOutFd = STDOUT_FILENO);

  /**
   * @brief Runs until the operator ends the session or a console that was
   * connected at least once stays unreachable.
   * @throws ConsoleConnectException when the endpoint is never reached.
   * @throws std::runtime_error when the local terminal fails.
   */
  void run();

  /** @brief Replaces the function used to wait between connect attempts. */
  void setSleeper(Sleeper _sleeper) { sleeper = _sleeper; }

  /** @brief Number of connections that were established by run(). */
  int getConnectionCount() const { return connectionCount; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  TunnelOptions options;
  int localInFd;
  int localOutFd;
  Sleeper sleeper;
  int connectionCount;
};
}  // namespace vc

#endif  // __VC_RECONNECTING_TUNNEL_HPP__
